#pragma once

#include <cstdint>

namespace wfstore::db::sharding {

/*
  Logical (history) shard -> physical database shard.

  physical = logical % total_physical_shards

  Pure and deterministic. The mapping only holds for one value of
  total_physical_shards: changing it without moving the data strands every
  row on a shard it no longer resolves to. Nothing here guards against that.

  Throws std::invalid_argument for total_physical_shards <= 0 or a negative
  logical shard id.
*/
int ResolvePhysicalShard(std::int64_t logical_shard_id, int total_physical_shards);

} // namespace wfstore::db::sharding
