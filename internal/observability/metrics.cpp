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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define CHRONICLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define CHRONICLE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace chronicle::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using chronicle::runtime::config::ObservabilityConfig;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kMeterName    = "chronicle";
constexpr const char* kMeterVersion = "0.1.0";

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Label and family switches read by the record calls.
struct MetricsOptions {
  bool append_metrics_enabled{true};
  bool projection_metrics_enabled{true};
  bool aggregate_type_labels_enabled{true};
};

MetricsOptions g_metrics_options;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == chronicle::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string MetricEndpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return env;
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return env;
  return UsesHttp(config) ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ObservabilityConfig& config) {
  if (UsesHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricEndpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions MakeReaderOptions(const ObservabilityConfig::MetricsConfig& metrics) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const uint32_t interval_ms     = metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 1000;
  options.export_interval_millis = std::chrono::milliseconds(std::max(metrics.min_collection_interval_ms(), interval_ms));
  if (metrics.export_timeout_ms() > 0) options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  return options;
}

MetricsOptions MakeMetricsOptions(const ObservabilityConfig::MetricsConfig& metrics) {
  MetricsOptions options;
  options.append_metrics_enabled        = !metrics.has_append_metrics_enabled() || metrics.append_metrics_enabled();
  options.projection_metrics_enabled    = !metrics.has_projection_metrics_enabled() || metrics.projection_metrics_enabled();
  options.aggregate_type_labels_enabled = !metrics.has_aggregate_type_labels_enabled() || metrics.aggregate_type_labels_enabled();
  return options;
}

// The SDK moved SetResource/AddMetricReader signatures between releases.
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> append_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      append_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> events_processed;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      batch_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> projection_errors;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   projection_lag_gauge;

  // last lag reported per projection, read by the gauge callback
  std::mutex                                    lag_mutex;
  std::unordered_map<std::string, std::int64_t> lag_values;
};

bool InitializeMetrics(const chronicle::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  g_metrics_options = MakeMetricsOptions(observability.metrics());

  auto exporter       = MakeMetricExporter(observability);
  auto reader_options = MakeReaderOptions(observability.metrics());
#ifdef CHRONICLE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto res   = resource::Resource::Create(resource::ResourceAttributes{{"service.name", std::string(kMeterName)}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  impl_->meter  = provider->GetMeter(kMeterName, kMeterVersion);

  impl_->append_count      = impl_->meter->CreateUInt64Counter("chronicle.append.count", "1", "Append calls by aggregate type and outcome");
  impl_->append_latency_ms = impl_->meter->CreateDoubleHistogram("chronicle.append.latency_ms", "ms", "AppendEvents latency in milliseconds");
  impl_->events_processed  = impl_->meter->CreateUInt64Counter("chronicle.projection.events_processed", "1", "Events applied by projections");
  impl_->batch_duration_ms =
      impl_->meter->CreateDoubleHistogram("chronicle.projection.batch_duration_ms", "ms", "Projection batch processing time in milliseconds");
  impl_->projection_errors = impl_->meter->CreateUInt64Counter("chronicle.projection.errors", "1", "Failed projection batches and ticks");
  impl_->projection_lag_gauge =
      impl_->meter->CreateInt64ObservableGauge("chronicle.projection.lag", "Events not yet applied by the projection", "1");
  impl_->projection_lag_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->lag_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [projection, lag] : impl->lag_values) {
          const std::initializer_list<AttributePair> attributes = {{"projection", projection}};
          int_result->Observe(lag, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAppend(std::string_view aggregate_type, bool success) {
  if (!impl_ || !impl_->append_count || !g_metrics_options.append_metrics_enabled) {
    return;
  }

  if (g_metrics_options.aggregate_type_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"aggregate_type", std::string(aggregate_type)}, {"success", success}};
    AddWithAttributes(impl_->append_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->append_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveAppendLatencyMs(std::string_view aggregate_type, double latency_ms) {
  if (!impl_ || !impl_->append_latency_ms || !g_metrics_options.append_metrics_enabled) {
    return;
  }

  if (g_metrics_options.aggregate_type_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"aggregate_type", std::string(aggregate_type)}};
    RecordWithAttributes(impl_->append_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->append_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::AddEventsProcessed(std::string_view projection, std::uint64_t count) {
  if (!impl_ || !impl_->events_processed || !g_metrics_options.projection_metrics_enabled || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}};
  AddWithAttributes(impl_->events_processed, count, attributes);
}

void Metrics::ObserveBatchDurationMs(std::string_view projection, double duration_ms) {
  if (!impl_ || !impl_->batch_duration_ms || !g_metrics_options.projection_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}};
  RecordWithAttributes(impl_->batch_duration_ms, duration_ms, attributes);
}

void Metrics::RecordProjectionError(std::string_view projection) {
  if (!impl_ || !impl_->projection_errors || !g_metrics_options.projection_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}};
  AddWithAttributes(impl_->projection_errors, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetProjectionLag(std::string_view projection, std::uint64_t lag) {
  if (!impl_ || !impl_->projection_lag_gauge || !g_metrics_options.projection_metrics_enabled) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->lag_mutex);
  impl_->lag_values[std::string(projection)] = static_cast<std::int64_t>(lag);
}

} // namespace chronicle::observability

#endif
