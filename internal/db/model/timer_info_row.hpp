#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

struct TimerInfoMapsRow {
  ExecutionIdentity execution;
  std::string       timer_id;

  Blob        data;
  std::string data_encoding;

  bool operator==(const TimerInfoMapsRow&) const = default;
};

using TimerInfoMapsFilter = MapFilter<std::string>;

} // namespace wfstore::db::model
