#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace wfstore::runtime::config {
class RuntimeConfig;
}

namespace wfstore::observability {

/*
  OpenTelemetry export of store operations.

  Built with ENABLE_OTEL: one CLIENT span per statement and the Metrics
  instruments below, exported over OTLP as configured in
  RuntimeConfig.observability. Without it every call is an inline no-op.
*/
bool InitializeTracing(const wfstore::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const wfstore::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Store operation metrics. op is the operation name
  (ReplaceIntoTimerInfoMaps, ...), status the ErrorCodeName of its result.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view op, std::string_view status);
  void ObserveOperationLatencyMs(std::string_view op, double latency_ms);
  void RecordRowsAffected(std::string_view op, std::int64_t rows);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const wfstore::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const wfstore::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, std::string_view) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRowsAffected(std::string_view, std::int64_t) {
}
#endif

} // namespace wfstore::observability
