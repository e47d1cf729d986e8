#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace wfstore::db {

/*
  Wraps one store operation in a span, the operation metrics and a log line.

  fn(int& physical_shard) runs the operation and sets the shard it routed to
  (left at -1 when it never got that far). Failures are logged at warn with
  op, table and shard; the Result is returned unchanged.
*/
template <typename Fn>
Result ObserveOperation(std::string_view verb, std::string_view kind, std::string_view table, Fn&& fn) {
  const std::string op = std::string(verb) + std::string(kind);

  observability::SpanScope span(op);
  span.SetAttribute("db.table", table);

  int        physical_shard = -1;
  const auto started_at     = std::chrono::steady_clock::now();
  Result     result         = fn(physical_shard);
  const auto elapsed_ms     = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();

  span.SetAttribute("db.shard", static_cast<std::int64_t>(physical_shard));
  span.SetAttribute("db.status", ErrorCodeName(result.code));

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordOperation(op, ErrorCodeName(result.code));
  metrics.ObserveOperationLatencyMs(op, elapsed_ms);

  if (!result) {
    span.RecordException(result.message);
    WFSTORE_LOG_WARN("store operation failed", {observability::StringField("op", op), observability::StringField("table", table),
                                                observability::IntField("shard", physical_shard),
                                                observability::StringField("code", ErrorCodeName(result.code)),
                                                observability::StringField("error", result.message)});
    return result;
  }

  metrics.RecordRowsAffected(op, result.rows_affected);
  WFSTORE_LOG_DEBUG("store operation", {observability::StringField("op", op), observability::StringField("table", table),
                                        observability::IntField("shard", physical_shard),
                                        observability::IntField("rows", result.rows_affected)});
  return result;
}

} // namespace wfstore::db
