#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

/*
  activity_info_maps row, keyed by schedule_id.

  last_heartbeat_updated_time is kept at microsecond precision by the store;
  anything finer is truncated on write.
*/
struct ActivityInfoMapsRow {
  ExecutionIdentity execution;
  std::int64_t      schedule_id = 0;

  Blob        data;
  std::string data_encoding;

  Blob      last_heartbeat_details;
  TimePoint last_heartbeat_updated_time{};

  bool operator==(const ActivityInfoMapsRow&) const = default;
};

// keys = schedule ids
using ActivityInfoMapsFilter = MapFilter<std::int64_t>;

} // namespace wfstore::db::model
