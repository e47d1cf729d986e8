#pragma once

#include <array>
#include <memory>
#include <vector>

#include "internal/db/api/execution_store.hpp"
#include "internal/db/sql/executor.hpp"
#include "internal/db/sql/query_templates.hpp"
#include "internal/db/sql/row_codec.hpp"
#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::db::sql {

/*
  SqlExecutionStore

  ExecutionStore over N physical shards of one SQL dialect.

  All eighteen operations are the same three templates (Replace / Select /
  Delete) instantiated with the MapCodec of their row type; the statement
  text comes from the QueryTemplates built once in the constructor from the
  registry. shards[i] is physical shard i.
*/
class SqlExecutionStore final : public ExecutionStore {
 public:
  // Throws std::invalid_argument when shards is empty or holds a null.
  SqlExecutionStore(Dialect dialect, std::shared_ptr<const SchemaRegistry> registry,
                    std::vector<std::shared_ptr<Executor>> shards);

  Result ReplaceIntoActivityInfoMaps(const Context&, const std::vector<model::ActivityInfoMapsRow>& rows) override;
  Result SelectFromActivityInfoMaps(const Context&, const model::ActivityInfoMapsFilter&,
                                    std::vector<model::ActivityInfoMapsRow>& out) override;
  Result DeleteFromActivityInfoMaps(const Context&, const model::ActivityInfoMapsFilter&) override;

  Result ReplaceIntoTimerInfoMaps(const Context&, const std::vector<model::TimerInfoMapsRow>& rows) override;
  Result SelectFromTimerInfoMaps(const Context&, const model::TimerInfoMapsFilter&,
                                 std::vector<model::TimerInfoMapsRow>& out) override;
  Result DeleteFromTimerInfoMaps(const Context&, const model::TimerInfoMapsFilter&) override;

  Result ReplaceIntoChildExecutionInfoMaps(const Context&, const std::vector<model::ChildExecutionInfoMapsRow>& rows) override;
  Result SelectFromChildExecutionInfoMaps(const Context&, const model::ChildExecutionInfoMapsFilter&,
                                          std::vector<model::ChildExecutionInfoMapsRow>& out) override;
  Result DeleteFromChildExecutionInfoMaps(const Context&, const model::ChildExecutionInfoMapsFilter&) override;

  Result ReplaceIntoRequestCancelInfoMaps(const Context&, const std::vector<model::RequestCancelInfoMapsRow>& rows) override;
  Result SelectFromRequestCancelInfoMaps(const Context&, const model::RequestCancelInfoMapsFilter&,
                                         std::vector<model::RequestCancelInfoMapsRow>& out) override;
  Result DeleteFromRequestCancelInfoMaps(const Context&, const model::RequestCancelInfoMapsFilter&) override;

  Result ReplaceIntoSignalInfoMaps(const Context&, const std::vector<model::SignalInfoMapsRow>& rows) override;
  Result SelectFromSignalInfoMaps(const Context&, const model::SignalInfoMapsFilter&,
                                  std::vector<model::SignalInfoMapsRow>& out) override;
  Result DeleteFromSignalInfoMaps(const Context&, const model::SignalInfoMapsFilter&) override;

  Result ReplaceIntoSignalsRequestedSets(const Context&, const std::vector<model::SignalsRequestedSetsRow>& rows) override;
  Result SelectFromSignalsRequestedSets(const Context&, const model::SignalsRequestedSetsFilter&,
                                        std::vector<model::SignalsRequestedSetsRow>& out) override;
  Result DeleteFromSignalsRequestedSets(const Context&, const model::SignalsRequestedSetsFilter&) override;

  int TotalPhysicalShards() const override {
    return static_cast<int>(shards_.size());
  }

  Dialect GetDialect() const {
    return dialect_;
  }

  const SchemaRegistry& Registry() const {
    return *registry_;
  }

  const QueryTemplates& Templates(MapKind kind) const {
    return templates_[static_cast<std::size_t>(kind)];
  }

 private:
  template <typename RecordT>
  Result Replace(const Context& ctx, const std::vector<RecordT>& rows);

  template <typename RecordT>
  Result Select(const Context& ctx, const typename MapCodec<RecordT>::Filter& filter, std::vector<RecordT>& out);

  template <typename RecordT>
  Result Delete(const Context& ctx, const typename MapCodec<RecordT>::Filter& filter);

  int       PhysicalShard(std::int64_t logical_shard_id) const;
  Executor& Shard(int physical) const {
    return *shards_[static_cast<std::size_t>(physical)];
  }

  Dialect                                        dialect_;
  std::shared_ptr<const SchemaRegistry>          registry_;
  std::vector<std::shared_ptr<Executor>>         shards_;
  std::array<QueryTemplates, kMapKindCount>      templates_;
};

} // namespace wfstore::db::sql
