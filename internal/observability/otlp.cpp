#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace wfstore::observability {

namespace {

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultUrl(OtlpSignal signal, bool http) {
  if (!http) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

const char* DbSystem(const wfstore::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) return "sqlite";
  if (database.has_postgres()) return "postgresql";
  return "memory";
}

} // namespace

OtlpEndpoint ResolveOtlpEndpoint(const wfstore::runtime::config::ObservabilityConfig& observability, OtlpSignal signal) {
  OtlpEndpoint endpoint;
  endpoint.http = observability.transport() == wfstore::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    endpoint.url = observability.otlp_endpoint();
  } else if (const char* url = std::getenv(SignalEnv(signal))) {
    endpoint.url = url;
  } else if (const char* url = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    endpoint.url = url;
  } else {
    endpoint.url = DefaultUrl(signal, endpoint.http);
  }
  return endpoint;
}

opentelemetry::sdk::resource::Resource BuildResource(const wfstore::runtime::config::RuntimeConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", std::string("wfstore")},
      {"service.version", std::string("0.1.0")},
      {"db.system", std::string(DbSystem(config.database()))},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace wfstore::observability

#endif
