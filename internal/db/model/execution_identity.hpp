#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wfstore::db::model {

using Blob      = std::vector<std::uint8_t>;
using TimePoint = std::chrono::system_clock::time_point;

/*
  Identity of one workflow run.

  shard_id is the LOGICAL (history) shard. It is stored in every row and is
  what the shard router maps onto a physical database shard.
*/
struct ExecutionIdentity {
  std::int64_t shard_id = 0;
  std::string  domain_id;
  std::string  workflow_id;
  std::string  run_id;

  bool operator==(const ExecutionIdentity&) const = default;
};

/*
  Filter for Select/Delete on one collection of one execution.

  keys:
    std::nullopt   -> every item of the execution (delete-all)
    empty vector   -> no item at all (delete is a no-op)
    non-empty      -> exactly those items
*/
template <typename KeyT>
struct MapFilter {
  ExecutionIdentity                execution;
  std::optional<std::vector<KeyT>> keys;
};

} // namespace wfstore::db::model
