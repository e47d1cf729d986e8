#include "internal/db/sharding/shard_router.hpp"

#include <stdexcept>
#include <string>

namespace wfstore::db::sharding {

int ResolvePhysicalShard(std::int64_t logical_shard_id, int total_physical_shards) {
  if (total_physical_shards <= 0) {
    throw std::invalid_argument("total physical shards must be positive, got " + std::to_string(total_physical_shards));
  }
  if (logical_shard_id < 0) {
    throw std::invalid_argument("logical shard id must not be negative, got " + std::to_string(logical_shard_id));
  }
  return static_cast<int>(logical_shard_id % total_physical_shards);
}

} // namespace wfstore::db::sharding
