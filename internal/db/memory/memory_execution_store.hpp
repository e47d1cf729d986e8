#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/execution_store.hpp"
#include "internal/db/sql/row_codec.hpp"
#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::db::memory {

/*
  In-process ExecutionStore.

  Same routing, no-op and last-writer-wins rules as the SQL store; items are
  kept per physical shard behind one mutex each. Timestamps are normalized
  to the precision the SQL backends keep.
*/
class MemoryExecutionStore final : public db::ExecutionStore {
public:
  // Throws std::invalid_argument when physical_shards <= 0.
  MemoryExecutionStore(std::shared_ptr<const sql::SchemaRegistry> registry, int physical_shards);

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
    return static_cast<int>(partitions_.size());
  }

private:
  using ExecutionKey = std::tuple<std::int64_t, std::string, std::string, std::string>;

  template <typename RecordT>
  using Table = std::map<ExecutionKey, std::map<typename sql::MapCodec<RecordT>::Key, RecordT>>;

  struct Partition {
    std::mutex mutex;
    std::tuple<Table<model::ActivityInfoMapsRow>, Table<model::TimerInfoMapsRow>, Table<model::ChildExecutionInfoMapsRow>,
               Table<model::RequestCancelInfoMapsRow>, Table<model::SignalInfoMapsRow>, Table<model::SignalsRequestedSetsRow>>
        tables;
  };

  template <typename RecordT>
  Result Replace(const Context& ctx, const std::vector<RecordT>& rows);

  template <typename RecordT>
  Result Select(const Context& ctx, const typename sql::MapCodec<RecordT>::Filter& filter, std::vector<RecordT>& out);

  template <typename RecordT>
  Result Delete(const Context& ctx, const typename sql::MapCodec<RecordT>::Filter& filter);

  static ExecutionKey KeyOf(const model::ExecutionIdentity& execution);

  std::shared_ptr<const sql::SchemaRegistry> registry_;
  std::vector<std::unique_ptr<Partition>>    partitions_;
};

} // namespace wfstore::db::memory
