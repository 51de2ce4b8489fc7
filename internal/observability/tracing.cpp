#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace forecast::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "forecast-sync";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Falls back to whatever provider is installed globally so spans opened
// before InitializeTracing, or in tests, go to the no-op tracer.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const forecast::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings = ResolveOtlpSettings(observability, OtlpSignal::kTraces);
  const resource::ResourceAttributes attrs = {{"service.name", settings.service_name}, {"service.version", std::string(kInstrumentationVersion)}};

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  {
    std::lock_guard lock(g_mutex);
    g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
    trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
    g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }

  FORECAST_LOG_INFO("Tracing enabled", {StringField("endpoint", settings.endpoint), BoolField("http", settings.http)});
  return true;
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard lock(g_mutex);
    provider = std::move(g_sdk_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

template <typename Fn>
void SpanScope::WithSpan(Fn&& fn) {
  if (impl_ && impl_->span) {
    fn(*impl_->span);
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  WithSpan([&](trace_api::Span& span) { span.SetAttribute(std::string(key), std::string(value)); });
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  WithSpan([&](trace_api::Span& span) { span.SetAttribute(std::string(key), value); });
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  WithSpan([&](trace_api::Span& span) { span.SetAttribute(std::string(key), value); });
}

void SpanScope::AddEvent(std::string_view name) {
  WithSpan([&](trace_api::Span& span) { span.AddEvent(std::string(name)); });
}

void SpanScope::RecordException(std::string_view description) {
  WithSpan([&](trace_api::Span& span) {
    span.AddEvent("exception", {{"exception.message", std::string(description)}});
    span.SetStatus(trace_api::StatusCode::kError, std::string(description));
  });
}

} // namespace forecast::observability

#endif
