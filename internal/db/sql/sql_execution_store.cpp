#include "internal/db/sql/sql_execution_store.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/observe_operation.hpp"
#include "internal/db/sharding/shard_router.hpp"

namespace wfstore::db::sql {

SqlExecutionStore::SqlExecutionStore(Dialect dialect, std::shared_ptr<const SchemaRegistry> registry,
                                     std::vector<std::shared_ptr<Executor>> shards)
    : dialect_(dialect), registry_(std::move(registry)), shards_(std::move(shards)) {
  if (!registry_) {
    throw std::invalid_argument("SqlExecutionStore: registry is required");
  }
  if (shards_.empty()) {
    throw std::invalid_argument("SqlExecutionStore: at least one physical shard is required");
  }
  for (std::size_t i = 0; i < shards_.size(); ++i) {
    if (!shards_[i]) {
      throw std::invalid_argument("SqlExecutionStore: physical shard " + std::to_string(i) + " has no executor");
    }
  }

  for (auto kind : kAllMapKinds) {
    templates_[static_cast<std::size_t>(kind)] = BuildQueryTemplates(registry_->Get(kind), dialect_);
  }
}

int SqlExecutionStore::PhysicalShard(std::int64_t logical_shard_id) const {
  return sharding::ResolvePhysicalShard(logical_shard_id, TotalPhysicalShards());
}

// ------------------------------------------------------------------
// Generic operations
// ------------------------------------------------------------------

template <typename RecordT>
Result SqlExecutionStore::Replace(const Context& ctx, const std::vector<RecordT>& rows) {
  using Codec     = MapCodec<RecordT>;
  const auto& t   = Templates(Codec::kKind);
  const auto& tbl = registry_->Get(Codec::kKind).table_name;

  return ObserveOperation("ReplaceInto", Codec::kName, tbl, [&](int& shard) -> Result {
    if (rows.empty()) {
      return Result::Ok();
    }

    try {
      shard = PhysicalShard(rows.front().execution.shard_id);
      for (const auto& r : rows) {
        if (PhysicalShard(r.execution.shard_id) != shard) {
          return Result::Err(ErrorCode::InvalidArgument, "batch spans more than one physical shard");
        }
      }
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    const auto batch = CollapseDuplicateKeys(rows);

    std::string sql;
    try {
      sql = RenderUpsert(t, batch.size(), Shard(shard).ParameterLimit());
    } catch (const ParameterExpansionError& e) {
      return Result::Err(ErrorCode::ParameterExpansion, e.what());
    }

    Params params;
    params.reserve(batch.size() * t.row_columns.size());
    for (const auto* r : batch) {
      EncodeIdentity(r->execution, params);
      Codec::Encode(*r, params);
    }

    return Shard(shard).Exec(ctx, sql, params);
  });
}

template <typename RecordT>
Result SqlExecutionStore::Select(const Context& ctx, const typename MapCodec<RecordT>::Filter& filter, std::vector<RecordT>& out) {
  using Codec     = MapCodec<RecordT>;
  const auto& t   = Templates(Codec::kKind);
  const auto& tbl = registry_->Get(Codec::kKind).table_name;

  return ObserveOperation("SelectFrom", Codec::kName, tbl, [&](int& shard) -> Result {
    try {
      shard = PhysicalShard(filter.execution.shard_id);
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    Params params;
    EncodeIdentity(filter.execution, params);

    std::vector<RecordT> rows;
    auto result = Shard(shard).Query(ctx, t.select_all, params, [&](const Row& row) {
      auto record      = Codec::Decode(row);
      record.execution = filter.execution;
      rows.push_back(std::move(record));
    });
    if (!result) {
      return result;
    }

    out = std::move(rows);
    return Result::Ok(static_cast<std::int64_t>(out.size()));
  });
}

template <typename RecordT>
Result SqlExecutionStore::Delete(const Context& ctx, const typename MapCodec<RecordT>::Filter& filter) {
  using Codec     = MapCodec<RecordT>;
  const auto& t   = Templates(Codec::kKind);
  const auto& tbl = registry_->Get(Codec::kKind).table_name;

  return ObserveOperation("DeleteFrom", Codec::kName, tbl, [&](int& shard) -> Result {
    // an explicit empty key set selects nothing
    if (filter.keys.has_value() && filter.keys->empty()) {
      return Result::Ok();
    }

    try {
      shard = PhysicalShard(filter.execution.shard_id);
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    Params params;
    EncodeIdentity(filter.execution, params);

    if (!filter.keys.has_value()) {
      return Shard(shard).Exec(ctx, t.delete_all, params);
    }

    std::string sql;
    try {
      sql = RenderDeleteByKeys(t, filter.keys->size(), Shard(shard).ParameterLimit());
    } catch (const ParameterExpansionError& e) {
      return Result::Err(ErrorCode::ParameterExpansion, e.what());
    }

    params.reserve(params.size() + filter.keys->size());
    for (const auto& key : *filter.keys) {
      params.emplace_back(key);
    }

    return Shard(shard).Exec(ctx, sql, params);
  });
}

// ------------------------------------------------------------------
// activity_info_maps
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoActivityInfoMaps(const Context& ctx, const std::vector<model::ActivityInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromActivityInfoMaps(const Context& ctx, const model::ActivityInfoMapsFilter& filter,
                                                     std::vector<model::ActivityInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromActivityInfoMaps(const Context& ctx, const model::ActivityInfoMapsFilter& filter) {
  return Delete<model::ActivityInfoMapsRow>(ctx, filter);
}

// ------------------------------------------------------------------
// timer_info_maps
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoTimerInfoMaps(const Context& ctx, const std::vector<model::TimerInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromTimerInfoMaps(const Context& ctx, const model::TimerInfoMapsFilter& filter,
                                                  std::vector<model::TimerInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromTimerInfoMaps(const Context& ctx, const model::TimerInfoMapsFilter& filter) {
  return Delete<model::TimerInfoMapsRow>(ctx, filter);
}

// ------------------------------------------------------------------
// child_execution_info_maps
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoChildExecutionInfoMaps(const Context& ctx,
                                                            const std::vector<model::ChildExecutionInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromChildExecutionInfoMaps(const Context& ctx, const model::ChildExecutionInfoMapsFilter& filter,
                                                           std::vector<model::ChildExecutionInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromChildExecutionInfoMaps(const Context& ctx, const model::ChildExecutionInfoMapsFilter& filter) {
  return Delete<model::ChildExecutionInfoMapsRow>(ctx, filter);
}

// ------------------------------------------------------------------
// request_cancel_info_maps
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoRequestCancelInfoMaps(const Context& ctx,
                                                           const std::vector<model::RequestCancelInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromRequestCancelInfoMaps(const Context& ctx, const model::RequestCancelInfoMapsFilter& filter,
                                                          std::vector<model::RequestCancelInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromRequestCancelInfoMaps(const Context& ctx, const model::RequestCancelInfoMapsFilter& filter) {
  return Delete<model::RequestCancelInfoMapsRow>(ctx, filter);
}

// ------------------------------------------------------------------
// signal_info_maps
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoSignalInfoMaps(const Context& ctx, const std::vector<model::SignalInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromSignalInfoMaps(const Context& ctx, const model::SignalInfoMapsFilter& filter,
                                                   std::vector<model::SignalInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromSignalInfoMaps(const Context& ctx, const model::SignalInfoMapsFilter& filter) {
  return Delete<model::SignalInfoMapsRow>(ctx, filter);
}

// ------------------------------------------------------------------
// signals_requested_sets
// ------------------------------------------------------------------

Result SqlExecutionStore::ReplaceIntoSignalsRequestedSets(const Context& ctx,
                                                          const std::vector<model::SignalsRequestedSetsRow>& rows) {
  return Replace(ctx, rows);
}

Result SqlExecutionStore::SelectFromSignalsRequestedSets(const Context& ctx, const model::SignalsRequestedSetsFilter& filter,
                                                         std::vector<model::SignalsRequestedSetsRow>& out) {
  return Select(ctx, filter, out);
}

Result SqlExecutionStore::DeleteFromSignalsRequestedSets(const Context& ctx, const model::SignalsRequestedSetsFilter& filter) {
  return Delete<model::SignalsRequestedSetsRow>(ctx, filter);
}

} // namespace wfstore::db::sql
