#pragma once

#include <exception>
#include <memory>
#include <string>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/sql/executor.hpp"

namespace wfstore::db::postgres {

/*
  Executor for one PostgreSQL shard.

  Every call borrows a pooled connection and runs in its own pqxx::work,
  committed before the connection goes back. The remaining Context deadline
  becomes SET LOCAL statement_timeout; cancelling the token issues a
  server-side cancel of the in-flight query.
*/
class PgExecutor final : public sql::Executor {
 public:
  explicit PgExecutor(std::shared_ptr<PgPool> pool);

  Result Exec(const Context& ctx, const std::string& sql, const sql::Params& params) override;
  Result Query(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;
  std::size_t ParameterLimit() override;

  void ExecuteSQL(const std::string& sql) override;

  // pqxx exception -> portable code, message is the driver text.
  static Result Translate(const Context& ctx, const std::exception& e);

 private:
  Result Run(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback* on_row);

  std::shared_ptr<PgPool> pool_;
};

} // namespace wfstore::db::postgres
