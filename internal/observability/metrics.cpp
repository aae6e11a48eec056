#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace recsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Labels = std::map<std::string, std::string>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const recsync::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = ResolveOtlpTarget(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(2000);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource());
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(target), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  RECSYNC_LOG_INFO("metrics enabled", {StringField("endpoint", target.endpoint), BoolField("http", target.http)});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

/*
  Instruments are created from whatever meter provider is installed when
  Instance() first runs; call InitializeMetrics before any sync or RPC.
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sync_records;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      sync_duration_ms;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->requests           = meter->CreateUInt64Counter("recsync.relay.requests", "Relay RPCs served", "1");
  impl_->request_latency_ms = meter->CreateDoubleHistogram("recsync.relay.latency", "Relay RPC latency", "ms");
  impl_->sync_records       = meter->CreateUInt64Counter("recsync.sync.records", "Records moved by sync runs", "1");
  impl_->sync_duration_ms   = meter->CreateDoubleHistogram("recsync.sync.duration", "Sync run duration", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const Labels labels{{"route", std::string(route)}, {"outcome", success ? "ok" : "error"}};
  impl_->requests->Add(1, labels);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const Labels labels{{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, labels, opentelemetry::context::Context{});
}

void Metrics::RecordSyncRecords(std::string_view direction, std::uint64_t count) {
  if (count == 0) {
    return;
  }
  const Labels labels{{"direction", std::string(direction)}};
  impl_->sync_records->Add(count, labels);
}

void Metrics::ObserveSyncDurationMs(double duration_ms) {
  impl_->sync_duration_ms->Record(duration_ms, opentelemetry::context::Context{});
}

} // namespace recsync::observability

#endif
