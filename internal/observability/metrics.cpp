#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define AUDIT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define AUDIT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otel_resource.hpp"

namespace audit::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

bool g_route_labels_enabled{true};

std::string MetricEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;

  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ingest_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> validation_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      write_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dlq_fallbacks;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dead_letters;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> partition_missing;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   dlq_depth_gauge;

  std::atomic<std::int64_t> dlq_depth{0};
};

bool InitializeMetrics(const audit::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);
  const auto endpoint    = MetricEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef AUDIT_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_route_labels_enabled = metric_config.route_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("audit-store", "0.1.0");

  impl_->request_count       = impl_->meter->CreateUInt64Counter("audit.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("audit.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->ingest_count        = impl_->meter->CreateUInt64Counter("audit.ingest.count", "1", "Ingested records by kind and result");
  impl_->validation_failures = impl_->meter->CreateUInt64Counter("audit.ingest.validation_failures", "1", "Rejected records by reason");
  impl_->write_latency_ms    = impl_->meter->CreateDoubleHistogram("audit.store.write_latency_ms", "ms", "Synchronous store write latency");
  impl_->dlq_fallbacks       = impl_->meter->CreateUInt64Counter("audit.dlq.fallback.count", "1", "Writes absorbed into the DLQ");
  impl_->dead_letters        = impl_->meter->CreateUInt64Counter("audit.dlq.dead_lettered.count", "1", "DLQ entries that exhausted retries");
  impl_->partition_missing   = impl_->meter->CreateUInt64Counter("audit.partition.missing.count", "1", "Writes into a missing partition");
  impl_->dlq_depth_gauge     = impl_->meter->CreateInt64ObservableGauge("audit.dlq.depth", "Pending and in-flight DLQ entries", "1");
  impl_->dlq_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->dlq_depth.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  if (g_route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  if (g_route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordIngest(std::string_view kind, std::string_view result) {
  if (!impl_ || !impl_->ingest_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}, {"result", std::string(result)}};
  AddWithAttributes(impl_->ingest_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordValidationFailure(std::string_view reason) {
  if (!impl_ || !impl_->validation_failures) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->validation_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveWriteLatencyMs(std::string_view kind, double latency_ms) {
  if (!impl_ || !impl_->write_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  RecordWithAttributes(impl_->write_latency_ms, latency_ms, attributes);
}

void Metrics::RecordDlqFallback(std::string_view destination) {
  if (!impl_ || !impl_->dlq_fallbacks) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"destination", std::string(destination)}};
  AddWithAttributes(impl_->dlq_fallbacks, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDeadLetter(std::string_view destination) {
  if (!impl_ || !impl_->dead_letters) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"destination", std::string(destination)}};
  AddWithAttributes(impl_->dead_letters, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordPartitionMissing(std::string_view kind) {
  if (!impl_ || !impl_->partition_missing) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->partition_missing, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetDlqDepth(std::uint64_t depth) {
  if (!impl_) {
    return;
  }
  impl_->dlq_depth.store(static_cast<std::int64_t>(depth));
}

} // namespace audit::observability

#endif
