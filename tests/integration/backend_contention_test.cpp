#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/context.hpp"
#include "internal/db/sql/schema_bootstrap.hpp"
#include "internal/db/sql/schema_registry.hpp"
#include "internal/db/sql/sql_execution_store.hpp"

#if WFSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_executor.hpp"
#endif

#if WFSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_executor.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using namespace std::chrono_literals;

using wfstore::db::CancellationToken;
using wfstore::db::Context;
using wfstore::db::ErrorCode;
using wfstore::db::model::ExecutionIdentity;
using wfstore::db::model::TimerInfoMapsFilter;
using wfstore::db::model::TimerInfoMapsRow;
using wfstore::db::sql::Dialect;
using wfstore::db::sql::Executor;
using wfstore::db::sql::SchemaRegistry;
using wfstore::db::sql::SqlExecutionStore;

// a statement that gives up at its deadline returns well before this
constexpr auto kPromptly = 2s;

std::string RunTag() {
  static const std::string tag = std::to_string(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  return tag;
}

std::shared_ptr<const SchemaRegistry> Registry() {
  static const auto registry = std::make_shared<const SchemaRegistry>(SchemaRegistry::Default());
  return registry;
}

ExecutionIdentity Execution(const std::string& name) {
  return ExecutionIdentity{.shard_id = 1, .domain_id = "contention", .workflow_id = "wf-" + name + "-" + RunTag(), .run_id = "run"};
}

TimerInfoMapsRow Timer(const ExecutionIdentity& execution, const std::string& id) {
  return TimerInfoMapsRow{.execution = execution, .timer_id = id, .data = {'x'}, .data_encoding = "json"};
}

template <typename Fn>
std::chrono::steady_clock::duration Timed(Fn&& fn) {
  const auto started = std::chrono::steady_clock::now();
  fn();
  return std::chrono::steady_clock::now() - started;
}

// Cancels the token from another thread after delay.
class DelayedCancel {
 public:
  DelayedCancel(std::shared_ptr<CancellationToken> token, std::chrono::milliseconds delay)
      : thread_([token, delay]() {
          std::this_thread::sleep_for(delay);
          token->Cancel();
        }) {
  }
  ~DelayedCancel() {
    thread_.join();
  }

 private:
  std::thread thread_;
};

// ------------------------------------------------------------------
// SQLite
// ------------------------------------------------------------------

#if WFSTORE_DB_SQLITE
using wfstore::db::sqlite::SqliteDB;
using wfstore::db::sqlite::SqliteExecutor;
using wfstore::db::sqlite::SqliteOptions;

struct SqliteShard {
  std::string                        path;
  std::shared_ptr<SqliteDB>          db;
  std::shared_ptr<SqliteExecutor>    executor;
  std::unique_ptr<SqlExecutionStore> store;

  ~SqliteShard() {
    store.reset();
    executor.reset();
    db.reset();
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
  }
};

std::unique_ptr<SqliteShard> OpenSqliteShard(const std::string& name, int busy_timeout_ms) {
  auto shard      = std::make_unique<SqliteShard>();
  shard->path     = (std::filesystem::temp_directory_path() / ("wfstore_contention_" + name + "_" + RunTag() + ".db")).string();
  shard->db       = std::make_shared<SqliteDB>(shard->path, SqliteOptions{.busy_timeout_ms = busy_timeout_ms});
  shard->executor = std::make_shared<SqliteExecutor>(shard->db);
  wfstore::db::sql::BootstrapSchema(*shard->executor, *Registry(), Dialect::kSqlite);
  shard->store = std::make_unique<SqlExecutionStore>(Dialect::kSqlite, Registry(), std::vector<std::shared_ptr<Executor>>{shard->executor});
  return shard;
}

void TestSqliteLockWaitEndsAtDeadline() {
  auto       shard     = OpenSqliteShard("deadline", 5000);
  const auto execution = Execution("sqlite-deadline");

  SqliteDB writer(shard->path);
  writer.Exec("BEGIN IMMEDIATE;");

  wfstore::db::Result r;
  const auto          elapsed = Timed([&] {
    r = shard->store->ReplaceIntoTimerInfoMaps(Context::WithTimeout(100ms), {Timer(execution, "a")});
  });
  assert(r.code == ErrorCode::DeadlineExceeded);
  assert(elapsed >= 100ms);
  assert(elapsed < kPromptly);

  writer.Exec("ROLLBACK;");
  assert(shard->store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(execution, "a")}));
}

void TestSqliteLockWaitEndsOnCancel() {
  auto       shard     = OpenSqliteShard("cancel", 5000);
  const auto execution = Execution("sqlite-cancel");

  SqliteDB writer(shard->path);
  writer.Exec("BEGIN IMMEDIATE;");

  auto                token = std::make_shared<CancellationToken>();
  wfstore::db::Result r;
  const auto          elapsed = Timed([&] {
    DelayedCancel cancel(token, 50ms);
    r = shard->store->ReplaceIntoTimerInfoMaps(Context::Background().WithCancellation(token), {Timer(execution, "a")});
  });
  assert(r.code == ErrorCode::Cancelled);
  assert(elapsed < kPromptly);

  writer.Exec("ROLLBACK;");
}

// without a deadline the configured busy timeout still bounds the wait
void TestSqliteLockWaitEndsAtBusyTimeout() {
  auto       shard     = OpenSqliteShard("busy", 200);
  const auto execution = Execution("sqlite-busy");

  SqliteDB writer(shard->path);
  writer.Exec("BEGIN IMMEDIATE;");

  wfstore::db::Result r;
  const auto          elapsed = Timed([&] {
    r = shard->store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(execution, "a")});
  });
  assert(r.code == ErrorCode::Busy);
  assert(elapsed >= 200ms);
  assert(elapsed < kPromptly);

  writer.Exec("ROLLBACK;");
}

// SQLITE_LIMIT_VARIABLE_NUMBER is 999 on libraries before 3.32
void TestSqliteConnectionParameterLimit() {
  auto       shard     = OpenSqliteShard("limit", 5000);
  const auto execution = Execution("sqlite-limit");

  {
    std::lock_guard lock(shard->db->Mutex());
    sqlite3_limit(shard->db->Handle(), SQLITE_LIMIT_VARIABLE_NUMBER, 999);
  }
  assert(shard->executor->ParameterLimit() == 999);

  std::vector<std::int64_t> keys;
  for (std::int64_t i = 0; i < 995; ++i) {
    keys.push_back(i);
  }
  auto r = shard->store->DeleteFromRequestCancelInfoMaps(
      Context::Background(), wfstore::db::model::RequestCancelInfoMapsFilter{.execution = execution, .keys = keys});
  assert(r);

  keys.push_back(995);
  r = shard->store->DeleteFromRequestCancelInfoMaps(Context::Background(),
                                                    wfstore::db::model::RequestCancelInfoMapsFilter{.execution = execution, .keys = keys});
  assert(r.code == ErrorCode::ParameterExpansion);
}
#endif

// ------------------------------------------------------------------
// PostgreSQL
// ------------------------------------------------------------------

#if WFSTORE_DB_POSTGRES
using wfstore::db::postgres::PgExecutor;
using wfstore::db::postgres::PgPool;

// one connection, held by the test while the store waits for it
void TestPostgresPoolWaitHonoursContext(const std::string& conninfo) {
  auto pool     = std::make_shared<PgPool>(conninfo, 1);
  auto executor = std::make_shared<PgExecutor>(pool);
  wfstore::db::sql::BootstrapSchema(*executor, *Registry(), Dialect::kPostgres);
  SqlExecutionStore store(Dialect::kPostgres, Registry(), std::vector<std::shared_ptr<Executor>>{executor});

  const auto execution = Execution("postgres-pool");
  auto       held      = pool->Acquire(Context::Background());
  assert(held);

  wfstore::db::Result r;
  auto                elapsed = Timed([&] {
    r = store.ReplaceIntoTimerInfoMaps(Context::WithTimeout(50ms), {Timer(execution, "a")});
  });
  assert(r.code == ErrorCode::DeadlineExceeded);
  assert(elapsed < kPromptly);

  auto token = std::make_shared<CancellationToken>();
  elapsed    = Timed([&] {
    DelayedCancel cancel(token, 50ms);
    r = store.ReplaceIntoTimerInfoMaps(Context::Background().WithCancellation(token), {Timer(execution, "a")});
  });
  assert(r.code == ErrorCode::Cancelled);
  assert(elapsed < kPromptly);

  // a cancelled statement never commits
  held.reset();
  std::vector<TimerInfoMapsRow> rows;
  assert(store.SelectFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = execution, .keys = std::nullopt}, rows));
  assert(rows.empty());

  assert(store.ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(execution, "a")}));
  assert(store.DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = execution, .keys = std::nullopt}));
}
#endif

} // namespace

int main() {
#if WFSTORE_DB_SQLITE
  TestSqliteLockWaitEndsAtDeadline();
  TestSqliteLockWaitEndsOnCancel();
  TestSqliteLockWaitEndsAtBusyTimeout();
  TestSqliteConnectionParameterLimit();
#endif

#if WFSTORE_DB_POSTGRES
  if (const char* uri = std::getenv("WFSTORE_TEST_PG_URI"); uri != nullptr && *uri != '\0') {
    TestPostgresPoolWaitHonoursContext(uri);
  } else {
    std::cout << "skipping postgres contention tests: WFSTORE_TEST_PG_URI is not set\n";
  }
#endif

  std::cout << "wfstore_integration_backend_contention: pass\n";
  return 0;
}
