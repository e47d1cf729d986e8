#include "sqlite_executor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <type_traits>
#include <variant>

#include "internal/db/sql/query_templates.hpp"

namespace wfstore::db::sqlite {

using wfstore::db::ErrorCode;
using wfstore::db::Result;

namespace {

// VM instructions between two progress callbacks
constexpr int kProgressOps = 1000;

// longest sleep between two lock attempts
constexpr std::chrono::milliseconds kMaxBusyPause{10};

int ProgressHandler(void* arg) {
  const auto* ctx = static_cast<const Context*>(arg);
  return (ctx->IsCancelled() || ctx->IsExpired()) ? 1 : 0;
}

/*
  Lock wait of one statement. Replaces sqlite3_busy_timeout while the
  statement runs: the progress handler is not called while SQLite waits for
  a lock, so the wait itself gives up once the Context is done or the
  configured busy timeout has passed.
*/
struct BusyWait {
  const Context*     ctx;
  Context::TimePoint give_up;
};

int BusyHandler(void* arg, int attempt) {
  const auto* wait = static_cast<const BusyWait*>(arg);
  if (wait->ctx->IsCancelled() || wait->ctx->IsExpired()) {
    return 0;
  }

  const auto now = Context::Clock::now();
  if (now >= wait->give_up) {
    return 0;
  }

  auto until = std::min(now + std::min(std::chrono::milliseconds(attempt + 1), kMaxBusyPause), wait->give_up);
  if (const auto& deadline = wait->ctx->Deadline()) {
    until = std::min(until, *deadline);
  }
  std::this_thread::sleep_until(until);
  return 1;
}

int BindParam(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          // zero-length blob binds as an empty blob, not NULL
          return sqlite3_bind_blob(st, idx, v.empty() ? "" : static_cast<const void*>(v.data()), static_cast<int>(v.size()),
                                   SQLITE_TRANSIENT);
        }
      },
      param);
}

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st_, col))) : "";
  }

  int64_t GetInt64(int col) const override {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }

  sql::Blob GetBlob(int col) const override {
    const auto* p = static_cast<const std::uint8_t*>(sqlite3_column_blob(st_, col));
    const int   n = sqlite3_column_bytes(st_, col);
    return p ? sql::Blob(p, p + n) : sql::Blob{};
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

/*
  Owns the prepared statement and the progress and busy handler
  registrations of one call. All are released on every exit path; the
  connection goes back to its configured busy timeout.
*/
class StatementGuard {
 public:
  StatementGuard(SqliteDB& db, const Context& ctx)
      : db_(db.Handle()),
        busy_timeout_ms_(db.BusyTimeoutMs()),
        wait_{&ctx, Context::Clock::now() + std::chrono::milliseconds(db.BusyTimeoutMs())} {
    sqlite3_progress_handler(db_, kProgressOps, &ProgressHandler, const_cast<Context*>(&ctx));
    sqlite3_busy_handler(db_, &BusyHandler, &wait_);
  }

  ~StatementGuard() {
    if (st_) sqlite3_finalize(st_);
    sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    sqlite3_busy_timeout(db_, busy_timeout_ms_);
  }

  StatementGuard(const StatementGuard&)            = delete;
  StatementGuard& operator=(const StatementGuard&) = delete;

  sqlite3_stmt** Out() {
    return &st_;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }

 private:
  sqlite3*      db_;
  int           busy_timeout_ms_;
  BusyWait      wait_;
  sqlite3_stmt* st_ = nullptr;
};

// A lock wait or a statement stopped by the Context reports the Context's
// reason; anything else is the driver's.
Result Failure(const Context& ctx, sqlite3* db, int rc) {
  const int primary = rc & 0xff;
  if (primary == SQLITE_INTERRUPT || primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    if (ctx.IsCancelled()) {
      return Result::Err(ErrorCode::Cancelled, sqlite3_errmsg(db));
    }
    if (ctx.IsExpired()) {
      return Result::Err(ErrorCode::DeadlineExceeded, sqlite3_errmsg(db));
    }
  }
  return SqliteExecutor::Translate(db, rc);
}

} // namespace

SqliteExecutor::SqliteExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteExecutor::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_RANGE:
    case SQLITE_TOOBIG:
    case SQLITE_MISMATCH:
      return Result::Err(ErrorCode::InvalidArgument, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteExecutor::Run(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback* on_row) {
  if (auto done = ctx.Check(); !done) {
    return done;
  }

  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  StatementGuard st(*db_, ctx);
  int            rc = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), st.Out(), nullptr);
  if (rc != SQLITE_OK) return Failure(ctx, db, rc);

  for (std::size_t i = 0; i < params.size(); ++i) {
    rc = BindParam(st.Get(), static_cast<int>(i + 1), params[i]);
    if (rc != SQLITE_OK) return Translate(db, rc);
  }

  SqliteRow row(st.Get());
  while ((rc = sqlite3_step(st.Get())) == SQLITE_ROW) {
    if (!on_row) continue;
    try {
      (*on_row)(row);
    } catch (const std::exception& e) {
      return Result::Err(ErrorCode::InternalError, std::string("row decode failed: ") + e.what());
    }
  }

  if (rc != SQLITE_DONE) return Failure(ctx, db, rc);

  return Result::Ok(on_row ? 0 : sqlite3_changes(db));
}

Result SqliteExecutor::Exec(const Context& ctx, const std::string& sql, const sql::Params& params) {
  return Run(ctx, sql, params, nullptr);
}

Result SqliteExecutor::Query(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  return Run(ctx, sql, params, &on_row);
}

// SQLITE_LIMIT_VARIABLE_NUMBER is per connection and 999 before 3.32
std::size_t SqliteExecutor::ParameterLimit() {
  std::lock_guard lock(db_->Mutex());
  const int       limit = sqlite3_limit(db_->Handle(), SQLITE_LIMIT_VARIABLE_NUMBER, -1);
  return std::min(static_cast<std::size_t>(std::max(limit, 0)), sql::MaxBoundParameters(sql::Dialect::kSqlite));
}

void SqliteExecutor::ExecuteSQL(const std::string& sql) {
  db_->Exec(sql);
}

} // namespace wfstore::db::sqlite
