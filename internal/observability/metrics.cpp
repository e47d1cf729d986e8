#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace wfstore::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr std::uint32_t kDefaultCollectionIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
std::atomic<bool>                          g_latency_histograms_enabled{true};

opentelemetry::nostd::string_view View(std::string_view s) {
  return {s.data(), s.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpEndpoint& endpoint) {
  if (endpoint.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.url;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint.url;
  options.use_ssl_credentials = !endpoint.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

/*
  Instruments, all keyed by op (ReplaceIntoTimerInfoMaps, ...):

    wfstore.db.operation.count       {op, status}
    wfstore.db.operation.latency_ms  {op}           optional
    wfstore.db.rows_affected         {op}
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rows_affected;
};

bool InitializeMetrics(const wfstore::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& settings = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : kDefaultCollectionIntervalMs);
  if (settings.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }

  auto exporter = MakeExporter(ResolveOtlpEndpoint(observability, OtlpSignal::kMetrics));
  auto reader   = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), BuildResource(config));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_latency_histograms_enabled.store(settings.operation_latency_histograms_enabled(), std::memory_order_relaxed);
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed at first use; call
// InitializeMetrics before the first store operation.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("wfstore", "0.1.0");

  impl_->operation_count      = meter->CreateUInt64Counter("wfstore.db.operation.count", "Store operations by result", "1");
  impl_->operation_latency_ms = meter->CreateDoubleHistogram("wfstore.db.operation.latency_ms", "Store operation latency", "ms");
  impl_->rows_affected = meter->CreateUInt64Counter("wfstore.db.rows_affected", "Rows written, deleted or returned by store operations", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view op, std::string_view status) {
  if (!impl_->operation_count) {
    return;
  }
  impl_->operation_count->Add(1, {AttributePair{"op", View(op)}, AttributePair{"status", View(status)}});
}

void Metrics::ObserveOperationLatencyMs(std::string_view op, double latency_ms) {
  if (!impl_->operation_latency_ms || !g_latency_histograms_enabled.load(std::memory_order_relaxed)) {
    return;
  }
  impl_->operation_latency_ms->Record(latency_ms, {AttributePair{"op", View(op)}}, opentelemetry::context::Context{});
}

void Metrics::RecordRowsAffected(std::string_view op, std::int64_t rows) {
  if (!impl_->rows_affected || rows <= 0) {
    return;
  }
  impl_->rows_affected->Add(static_cast<std::uint64_t>(rows), {AttributePair{"op", View(op)}});
}

} // namespace wfstore::observability

#endif
