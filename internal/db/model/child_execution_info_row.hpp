#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

// In-flight child workflow started by the execution, keyed by the id of the
// initiating event.
struct ChildExecutionInfoMapsRow {
  ExecutionIdentity execution;
  std::int64_t      initiated_id = 0;

  Blob        data;
  std::string data_encoding;

  bool operator==(const ChildExecutionInfoMapsRow&) const = default;
};

using ChildExecutionInfoMapsFilter = MapFilter<std::int64_t>;

} // namespace wfstore::db::model
