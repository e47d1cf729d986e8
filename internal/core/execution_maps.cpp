#include "execution_maps.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace wfstore::core {

using db::ErrorCode;
using db::Result;
using db::sql::MapKind;

namespace {

template <typename FilterT>
FilterT AllOf(const db::model::ExecutionIdentity& execution) {
  FilterT filter;
  filter.execution = execution;
  return filter;
}

Result DeleteAll(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution, MapKind kind) {
  namespace model = db::model;
  switch (kind) {
    case MapKind::kActivityInfo:
      return store.DeleteFromActivityInfoMaps(ctx, AllOf<model::ActivityInfoMapsFilter>(execution));
    case MapKind::kTimerInfo:
      return store.DeleteFromTimerInfoMaps(ctx, AllOf<model::TimerInfoMapsFilter>(execution));
    case MapKind::kChildExecutionInfo:
      return store.DeleteFromChildExecutionInfoMaps(ctx, AllOf<model::ChildExecutionInfoMapsFilter>(execution));
    case MapKind::kRequestCancelInfo:
      return store.DeleteFromRequestCancelInfoMaps(ctx, AllOf<model::RequestCancelInfoMapsFilter>(execution));
    case MapKind::kSignalInfo:
      return store.DeleteFromSignalInfoMaps(ctx, AllOf<model::SignalInfoMapsFilter>(execution));
    case MapKind::kSignalsRequested:
      return store.DeleteFromSignalsRequestedSets(ctx, AllOf<model::SignalsRequestedSetsFilter>(execution));
  }
  return Result::Err(ErrorCode::InternalError, "unknown map kind");
}

template <typename RowT, typename FilterT, typename SelectFn>
Result Count(const db::model::ExecutionIdentity& execution, SelectFn&& select) {
  std::vector<RowT> rows;
  return select(AllOf<FilterT>(execution), rows);
}

Result CountOne(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution, MapKind kind) {
  namespace model = db::model;
  switch (kind) {
    case MapKind::kActivityInfo:
      return Count<model::ActivityInfoMapsRow, model::ActivityInfoMapsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromActivityInfoMaps(ctx, f, rows); });
    case MapKind::kTimerInfo:
      return Count<model::TimerInfoMapsRow, model::TimerInfoMapsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromTimerInfoMaps(ctx, f, rows); });
    case MapKind::kChildExecutionInfo:
      return Count<model::ChildExecutionInfoMapsRow, model::ChildExecutionInfoMapsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromChildExecutionInfoMaps(ctx, f, rows); });
    case MapKind::kRequestCancelInfo:
      return Count<model::RequestCancelInfoMapsRow, model::RequestCancelInfoMapsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromRequestCancelInfoMaps(ctx, f, rows); });
    case MapKind::kSignalInfo:
      return Count<model::SignalInfoMapsRow, model::SignalInfoMapsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromSignalInfoMaps(ctx, f, rows); });
    case MapKind::kSignalsRequested:
      return Count<model::SignalsRequestedSetsRow, model::SignalsRequestedSetsFilter>(
          execution, [&](const auto& f, auto& rows) { return store.SelectFromSignalsRequestedSets(ctx, f, rows); });
  }
  return Result::Err(ErrorCode::InternalError, "unknown map kind");
}

} // namespace

Result PurgeExecutionMaps(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution) {
  std::int64_t removed = 0;
  for (auto kind : db::sql::kAllMapKinds) {
    auto r = DeleteAll(store, ctx, execution, kind);
    if (!r) {
      WFSTORE_LOG_WARN("execution purge stopped", {observability::StringField("map", db::sql::MapKindName(kind)),
                                                    observability::StringField("workflow_id", execution.workflow_id),
                                                    observability::StringField("run_id", execution.run_id),
                                                    observability::StringField("error", r.message)});
      return r;
    }
    removed += r.rows_affected;
  }

  WFSTORE_LOG_INFO("execution maps purged", {observability::IntField("shard_id", execution.shard_id),
                                             observability::StringField("domain_id", execution.domain_id),
                                             observability::StringField("workflow_id", execution.workflow_id),
                                             observability::StringField("run_id", execution.run_id),
                                             observability::IntField("rows", removed)});
  return Result::Ok(removed);
}

Result CountExecutionMaps(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution,
                          MapItemCounts& counts) {
  MapItemCounts out{};
  for (auto kind : db::sql::kAllMapKinds) {
    auto r = CountOne(store, ctx, execution, kind);
    if (!r) {
      return r;
    }
    out[static_cast<std::size_t>(kind)] = r.rows_affected;
  }
  counts = out;
  return Result::Ok();
}

} // namespace wfstore::core
