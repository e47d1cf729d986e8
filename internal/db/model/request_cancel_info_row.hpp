#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

struct RequestCancelInfoMapsRow {
  ExecutionIdentity execution;
  std::int64_t      initiated_id = 0;

  Blob        data;
  std::string data_encoding;

  bool operator==(const RequestCancelInfoMapsRow&) const = default;
};

using RequestCancelInfoMapsFilter = MapFilter<std::int64_t>;

} // namespace wfstore::db::model
