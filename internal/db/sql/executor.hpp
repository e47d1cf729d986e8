#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "internal/db/api/context.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace wfstore::db::sql {

/*
  Executor

  Runs single parameterized statements against ONE physical shard.

  - Each call is its own atomic unit (autocommit / one pqxx::work).
  - Must honour the Context: fail fast when it is already done, abort the
    running statement when the deadline passes or the token is cancelled.
  - Never throws from Exec/Query; every failure is translated to a Result
    carrying the driver's message.
  - Shared by all calls routed to the shard; must be thread-safe.
*/

class Executor : public MigrationExecutor {
 public:
  using RowCallback = std::function<void(const Row&)>;

  ~Executor() override = default;

  // Result::rows_affected carries the backend's changed-row count.
  virtual Result Exec(const Context& ctx, const std::string& sql, const Params& params) = 0;

  // on_row is called once per result row; an exception thrown by it aborts
  // the query and is returned as InternalError.
  virtual Result Query(const Context& ctx, const std::string& sql, const Params& params, const RowCallback& on_row) = 0;

  // Most parameters one statement may bind on this shard's connection. Never
  // above MaxBoundParameters of the dialect.
  virtual std::size_t ParameterLimit() = 0;
};

} // namespace wfstore::db::sql
