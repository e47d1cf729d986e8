#pragma once

#include <array>
#include <cstdint>

#include "internal/db/api/context.hpp"
#include "internal/db/api/execution_store.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/model/execution_identity.hpp"
#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::core {

/*
  Whole-execution helpers over an ExecutionStore.

  The store has no cascade: when an execution goes away its items must be
  removed kind by kind. These run one statement per kind, in MapKind order,
  and stop at the first failure. Nothing spans the kinds; a failure leaves
  the kinds before it already purged.
*/

// Delete-all on every map of the execution. rows_affected is the total.
db::Result PurgeExecutionMaps(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution);

using MapItemCounts = std::array<std::int64_t, db::sql::kMapKindCount>;

// Number of items per map of the execution, indexed by MapKind.
db::Result CountExecutionMaps(db::ExecutionStore& store, const db::Context& ctx, const db::model::ExecutionIdentity& execution,
                              MapItemCounts& counts);

} // namespace wfstore::core
