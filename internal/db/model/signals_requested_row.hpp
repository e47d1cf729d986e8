#pragma once

#include "internal/db/model/execution_identity.hpp"

namespace wfstore::db::model {

/*
  Set of signal request ids already delivered to the execution.

  Existence-only: there is no payload, a row either exists or not.
*/
struct SignalsRequestedSetsRow {
  ExecutionIdentity execution;
  std::string       signal_id;

  bool operator==(const SignalsRequestedSetsRow&) const = default;
};

using SignalsRequestedSetsFilter = MapFilter<std::string>;

} // namespace wfstore::db::model
