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
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FORECAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FORECAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace forecast::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::uint32_t kDefaultExportIntervalMs = 10000;

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
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sync_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      sync_cycle_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retention_records;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      retention_duration_ms;
};

bool InitializeMetrics(const forecast::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveOtlpSettings(observability, OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = settings.endpoint;
    options.use_ssl_credentials = settings.use_tls;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs);
#ifdef FORECAST_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  const resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  const auto                         res   = resource::Resource::Create(attrs);
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
  impl_->meter  = provider->GetMeter("forecast-sync", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("forecast.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("forecast.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->sync_outcomes      = impl_->meter->CreateUInt64Counter("forecast.sync.items", "1", "Write-back items by outcome");
  impl_->sync_cycle_duration_ms =
      impl_->meter->CreateDoubleHistogram("forecast.sync.cycle_duration_ms", "ms", "Write-back cycle duration in milliseconds");
  impl_->retention_records = impl_->meter->CreateUInt64Counter("forecast.retention.records", "1", "Raw intake records handled by retention");
  impl_->retention_duration_ms =
      impl_->meter->CreateDoubleHistogram("forecast.retention.duration_ms", "ms", "Retention run duration in milliseconds");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordSyncOutcome(std::string_view outcome, std::uint64_t count) {
  if (!impl_ || !impl_->sync_outcomes || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->sync_outcomes, count, attributes);
}

void Metrics::ObserveSyncCycleDurationMs(double duration_ms) {
  if (!impl_ || !impl_->sync_cycle_duration_ms) {
    return;
  }

  RecordWithAttributes(impl_->sync_cycle_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordRetentionRecords(std::string_view action, std::uint64_t count) {
  if (!impl_ || !impl_->retention_records || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"action", std::string(action)}};
  AddWithAttributes(impl_->retention_records, count, attributes);
}

void Metrics::ObserveRetentionDurationMs(double duration_ms) {
  if (!impl_ || !impl_->retention_duration_ms) {
    return;
  }

  RecordWithAttributes(impl_->retention_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

} // namespace forecast::observability

#endif
