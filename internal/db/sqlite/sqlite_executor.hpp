#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/executor.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace wfstore::db::sqlite {

/*
  Executor for one SQLite shard.

  Statements are prepared per call (the variadic ones differ per call anyway)
  and run in autocommit. A progress handler aborts the running statement and
  a busy handler ends the wait for a locked shard once the Context deadline
  passes or its token is cancelled.
*/
class SqliteExecutor final : public sql::Executor {
 public:
  explicit SqliteExecutor(std::shared_ptr<SqliteDB> db);

  Result Exec(const Context& ctx, const std::string& sql, const sql::Params& params) override;
  Result Query(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;
  std::size_t ParameterLimit() override;

  void ExecuteSQL(const std::string& sql) override;

  const std::shared_ptr<SqliteDB>& Database() const {
    return db_;
  }

  // sqlite rc -> portable code; message is sqlite3_errmsg(db).
  static Result Translate(sqlite3* db, int rc);

 private:
  Result Run(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback* on_row);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace wfstore::db::sqlite
