#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace wfstore::runtime::config {
class ObservabilityConfig;
class RuntimeConfig;
}

namespace wfstore::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpEndpoint {
  std::string url;
  bool        http     = false;
  bool        insecure = true;
};

/*
  Where one signal is exported to.

  otlp_endpoint from the config, else OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  else OTEL_EXPORTER_OTLP_ENDPOINT, else the collector default of the
  transport (grpc :4317, http :4318/v1/<signal>).
*/
OtlpEndpoint ResolveOtlpEndpoint(const wfstore::runtime::config::ObservabilityConfig& observability, OtlpSignal signal);

// service.name / service.version plus db.system of the configured backend.
opentelemetry::sdk::resource::Resource BuildResource(const wfstore::runtime::config::RuntimeConfig& config);

} // namespace wfstore::observability

#endif
