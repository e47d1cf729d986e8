#include "pg_executor.hpp"

#include "internal/db/sql/query_templates.hpp"
#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <variant>

namespace wfstore::db::postgres {

using wfstore::db::ErrorCode;
using wfstore::db::Result;

namespace {

using Bytes = std::basic_string<std::byte>;

pqxx::params ToPqxxParams(const sql::Params& params) {
  pqxx::params out;
  out.reserve(params.size());
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, sql::Blob>) {
            // bytea goes binary
            out.append(Bytes(reinterpret_cast<const std::byte*>(v.data()), v.size()));
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].as<std::string>();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  sql::Blob GetBlob(int col) const override {
    auto bytes = row_[col].as<Bytes>();
    const auto* p = reinterpret_cast<const std::uint8_t*>(bytes.data());
    return sql::Blob(p, p + bytes.size());
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

} // namespace

PgExecutor::PgExecutor(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgExecutor::Translate(const Context& ctx, const std::exception& e) {
  // 57014: statement_timeout fired or a cancel request reached the server
  if (dynamic_cast<const pqxx::query_canceled*>(&e)) {
    return Result::Err(ctx.IsCancelled() ? ErrorCode::Cancelled : ErrorCode::DeadlineExceeded, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const auto& state = sql_error->sqlstate();
    // class 22: data exception, 53: insufficient resources, 40P01: deadlock
    if (state.rfind("22", 0) == 0) {
      return Result::Err(ErrorCode::InvalidArgument, e.what());
    }
    if (state.rfind("53", 0) == 0 || state == "40P01") {
      return Result::Err(ErrorCode::Busy, e.what());
    }
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgExecutor::Run(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback* on_row) {
  if (auto done = ctx.Check(); !done) {
    return done;
  }

  try {
    auto conn = pool_->Acquire(ctx);
    if (!conn) {
      return ctx.Check();
    }

    // fires at most while this statement is in flight
    CancelSubscription cancel(ctx.Token(), [&conn]() {
      try {
        conn->cancel_query();
      } catch (const std::exception& e) {
        // the statement still ends at its deadline
        WFSTORE_LOG_WARN("postgres cancel request failed", {observability::StringField("error", e.what())});
      }
    });

    // a Cancel() before the subscription found no query to cancel
    if (auto done = ctx.Check(); !done) {
      return done;
    }

    pqxx::work tx(*conn);
    if (auto remaining = ctx.Remaining()) {
      const auto timeout_ms = std::max<std::int64_t>(remaining->count(), 1);
      tx.exec("SET LOCAL statement_timeout = " + std::to_string(timeout_ms));
    }

    auto res = tx.exec_params(sql, ToPqxxParams(params));

    if (on_row) {
      for (const auto& row : res) {
        PgRow wrapped(row);
        try {
          (*on_row)(wrapped);
        } catch (const std::exception& e) {
          return Result::Err(ErrorCode::InternalError, std::string("row decode failed: ") + e.what());
        }
      }
    }

    // cancelled after the statement finished: roll back instead of committing
    if (ctx.IsCancelled()) {
      return Result::Err(ErrorCode::Cancelled, "context cancelled");
    }

    tx.commit();
    return Result::Ok(on_row ? 0 : static_cast<std::int64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(ctx, e);
  }
}

Result PgExecutor::Exec(const Context& ctx, const std::string& sql, const sql::Params& params) {
  return Run(ctx, sql, params, nullptr);
}

Result PgExecutor::Query(const Context& ctx, const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  return Run(ctx, sql, params, &on_row);
}

// fixed by the wire protocol (Int16 parameter count)
std::size_t PgExecutor::ParameterLimit() {
  return sql::MaxBoundParameters(sql::Dialect::kPostgres);
}

void PgExecutor::ExecuteSQL(const std::string& sql) {
  auto       conn = pool_->Acquire(Context::Background());
  pqxx::work tx(*conn);
  tx.exec(sql);
  tx.commit();
}

} // namespace wfstore::db::postgres
