#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace chronicle::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using chronicle::runtime::config::ObservabilityConfig;
using TracingConfig = chronicle::runtime::config::ObservabilityConfig_TracingConfig;

namespace {

constexpr const char* kTracerName    = "chronicle";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == chronicle::runtime::config::OTLP_TRANSPORT_HTTP;
}

// Config wins over OTEL_EXPORTER_OTLP_* env, which wins over collector defaults.
std::string TraceEndpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return env;
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return env;
  return UsesHttp(config) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ObservabilityConfig& config) {
  if (UsesHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TraceEndpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TraceEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeSpanProcessor(const TracingConfig& tracing,
                                                           std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

// nullptr keeps the SDK default sampler.
std::unique_ptr<sdktrace::Sampler> MakeSampler(TracingConfig::TraceHint hint) {
  switch (hint) {
    case TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return nullptr;
  }
}

} // namespace

bool InitializeTracing(const chronicle::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto processor = MakeSpanProcessor(observability.tracing(), MakeSpanExporter(observability));
  auto res       = resource::Resource::Create(resource::ResourceAttributes{{"service.name", std::string(kTracerName)}});

  std::unique_ptr<sdktrace::TracerProvider> provider;
  if (auto sampler = MakeSampler(observability.tracing().trace_hint())) {
    provider = sdktrace::TracerProviderFactory::Create(std::move(processor), res, std::move(sampler));
  } else {
    provider = sdktrace::TracerProviderFactory::Create(std::move(processor), res);
  }

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

/*
  SpanScope

  Starts a span on construction and makes it active for the scope's
  lifetime. Without an installed provider the global no-op tracer is used.
*/
struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool Live() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracer;
  if (!tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) tracer = provider->GetTracer(kTracerName, kTracerVersion);
  }
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->Live()) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->Live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->Live()) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace chronicle::observability

#endif
