#include "memory_execution_store.hpp"

#include <stdexcept>

#include "internal/db/api/observe_operation.hpp"
#include "internal/db/sharding/shard_router.hpp"

namespace wfstore::db::memory {

MemoryExecutionStore::MemoryExecutionStore(std::shared_ptr<const sql::SchemaRegistry> registry, int physical_shards)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("MemoryExecutionStore: registry is required");
  }
  if (physical_shards <= 0) {
    throw std::invalid_argument("MemoryExecutionStore: physical_shards must be > 0");
  }
  partitions_.reserve(static_cast<std::size_t>(physical_shards));
  for (int i = 0; i < physical_shards; ++i) {
    partitions_.push_back(std::make_unique<Partition>());
  }
}

MemoryExecutionStore::ExecutionKey MemoryExecutionStore::KeyOf(const model::ExecutionIdentity& execution) {
  return {execution.shard_id, execution.domain_id, execution.workflow_id, execution.run_id};
}

template <typename RecordT>
Result MemoryExecutionStore::Replace(const Context& ctx, const std::vector<RecordT>& rows) {
  using Codec = sql::MapCodec<RecordT>;

  return ObserveOperation("ReplaceInto", Codec::kName, registry_->Get(Codec::kKind).table_name, [&](int& shard) -> Result {
    if (rows.empty()) {
      return Result::Ok();
    }

    try {
      shard = sharding::ResolvePhysicalShard(rows.front().execution.shard_id, TotalPhysicalShards());
      for (const auto& r : rows) {
        if (sharding::ResolvePhysicalShard(r.execution.shard_id, TotalPhysicalShards()) != shard) {
          return Result::Err(ErrorCode::InvalidArgument, "batch spans more than one physical shard");
        }
      }
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    if (auto done = ctx.Check(); !done) {
      return done;
    }

    const auto batch = sql::CollapseDuplicateKeys(rows);

    auto&           p = *partitions_[static_cast<std::size_t>(shard)];
    std::lock_guard lock(p.mutex);
    auto&           table = std::get<Table<RecordT>>(p.tables);

    // existence-only kinds keep the first row, like ON CONFLICT DO NOTHING
    const bool   keep_existing = registry_->Get(Codec::kKind).value_columns.empty();
    std::int64_t changed       = 0;
    for (const auto* r : batch) {
      RecordT stored = *r;
      Codec::Normalize(stored);
      auto  key   = Codec::KeyOf(stored);
      auto& items = table[KeyOf(r->execution)];
      if (keep_existing) {
        changed += items.try_emplace(std::move(key), std::move(stored)).second ? 1 : 0;
      } else {
        items.insert_or_assign(std::move(key), std::move(stored));
        ++changed;
      }
    }
    return Result::Ok(changed);
  });
}

template <typename RecordT>
Result MemoryExecutionStore::Select(const Context& ctx, const typename sql::MapCodec<RecordT>::Filter& filter, std::vector<RecordT>& out) {
  using Codec = sql::MapCodec<RecordT>;

  return ObserveOperation("SelectFrom", Codec::kName, registry_->Get(Codec::kKind).table_name, [&](int& shard) -> Result {
    try {
      shard = sharding::ResolvePhysicalShard(filter.execution.shard_id, TotalPhysicalShards());
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    if (auto done = ctx.Check(); !done) {
      return done;
    }

    std::vector<RecordT> rows;
    {
      auto&           p = *partitions_[static_cast<std::size_t>(shard)];
      std::lock_guard lock(p.mutex);
      const auto&     table = std::get<Table<RecordT>>(p.tables);
      auto            it    = table.find(KeyOf(filter.execution));
      if (it != table.end()) {
        rows.reserve(it->second.size());
        for (const auto& [_, record] : it->second) {
          rows.push_back(record);
          rows.back().execution = filter.execution;
        }
      }
    }

    out = std::move(rows);
    return Result::Ok(static_cast<std::int64_t>(out.size()));
  });
}

template <typename RecordT>
Result MemoryExecutionStore::Delete(const Context& ctx, const typename sql::MapCodec<RecordT>::Filter& filter) {
  using Codec = sql::MapCodec<RecordT>;

  return ObserveOperation("DeleteFrom", Codec::kName, registry_->Get(Codec::kKind).table_name, [&](int& shard) -> Result {
    if (filter.keys.has_value() && filter.keys->empty()) {
      return Result::Ok();
    }

    try {
      shard = sharding::ResolvePhysicalShard(filter.execution.shard_id, TotalPhysicalShards());
    } catch (const std::invalid_argument& e) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }

    if (auto done = ctx.Check(); !done) {
      return done;
    }

    auto&           p = *partitions_[static_cast<std::size_t>(shard)];
    std::lock_guard lock(p.mutex);
    auto&           table = std::get<Table<RecordT>>(p.tables);
    auto            it    = table.find(KeyOf(filter.execution));
    if (it == table.end()) {
      return Result::Ok();
    }

    std::int64_t removed = 0;
    if (!filter.keys.has_value()) {
      removed = static_cast<std::int64_t>(it->second.size());
      it->second.clear();
    } else {
      for (const auto& key : *filter.keys) {
        removed += static_cast<std::int64_t>(it->second.erase(key));
      }
    }
    if (it->second.empty()) {
      table.erase(it);
    }
    return Result::Ok(removed);
  });
}

// ------------------------------------------------------------------
// Per kind
// ------------------------------------------------------------------

Result MemoryExecutionStore::ReplaceIntoActivityInfoMaps(const Context& ctx, const std::vector<model::ActivityInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromActivityInfoMaps(const Context& ctx, const model::ActivityInfoMapsFilter& filter,
                                                        std::vector<model::ActivityInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromActivityInfoMaps(const Context& ctx, const model::ActivityInfoMapsFilter& filter) {
  return Delete<model::ActivityInfoMapsRow>(ctx, filter);
}

Result MemoryExecutionStore::ReplaceIntoTimerInfoMaps(const Context& ctx, const std::vector<model::TimerInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromTimerInfoMaps(const Context& ctx, const model::TimerInfoMapsFilter& filter,
                                                     std::vector<model::TimerInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromTimerInfoMaps(const Context& ctx, const model::TimerInfoMapsFilter& filter) {
  return Delete<model::TimerInfoMapsRow>(ctx, filter);
}

Result MemoryExecutionStore::ReplaceIntoChildExecutionInfoMaps(const Context& ctx,
                                                               const std::vector<model::ChildExecutionInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromChildExecutionInfoMaps(const Context& ctx, const model::ChildExecutionInfoMapsFilter& filter,
                                                              std::vector<model::ChildExecutionInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromChildExecutionInfoMaps(const Context& ctx, const model::ChildExecutionInfoMapsFilter& filter) {
  return Delete<model::ChildExecutionInfoMapsRow>(ctx, filter);
}

Result MemoryExecutionStore::ReplaceIntoRequestCancelInfoMaps(const Context& ctx,
                                                              const std::vector<model::RequestCancelInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromRequestCancelInfoMaps(const Context& ctx, const model::RequestCancelInfoMapsFilter& filter,
                                                             std::vector<model::RequestCancelInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromRequestCancelInfoMaps(const Context& ctx, const model::RequestCancelInfoMapsFilter& filter) {
  return Delete<model::RequestCancelInfoMapsRow>(ctx, filter);
}

Result MemoryExecutionStore::ReplaceIntoSignalInfoMaps(const Context& ctx, const std::vector<model::SignalInfoMapsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromSignalInfoMaps(const Context& ctx, const model::SignalInfoMapsFilter& filter,
                                                      std::vector<model::SignalInfoMapsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromSignalInfoMaps(const Context& ctx, const model::SignalInfoMapsFilter& filter) {
  return Delete<model::SignalInfoMapsRow>(ctx, filter);
}

Result MemoryExecutionStore::ReplaceIntoSignalsRequestedSets(const Context& ctx,
                                                             const std::vector<model::SignalsRequestedSetsRow>& rows) {
  return Replace(ctx, rows);
}

Result MemoryExecutionStore::SelectFromSignalsRequestedSets(const Context& ctx, const model::SignalsRequestedSetsFilter& filter,
                                                            std::vector<model::SignalsRequestedSetsRow>& out) {
  return Select(ctx, filter, out);
}

Result MemoryExecutionStore::DeleteFromSignalsRequestedSets(const Context& ctx, const model::SignalsRequestedSetsFilter& filter) {
  return Delete<model::SignalsRequestedSetsRow>(ctx, filter);
}

} // namespace wfstore::db::memory
