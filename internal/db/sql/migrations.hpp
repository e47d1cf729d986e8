#pragma once

#include <string>
#include <vector>

namespace wfstore::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Throws on failure.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order, stopping at the first failure.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace wfstore::db::sql
