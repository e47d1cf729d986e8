#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

struct SignalInfoMapsRow {
  ExecutionIdentity execution;
  std::int64_t      initiated_id = 0;

  Blob        data;
  std::string data_encoding;

  bool operator==(const SignalInfoMapsRow&) const = default;
};

using SignalInfoMapsFilter = MapFilter<std::int64_t>;

} // namespace wfstore::db::model
