#pragma once

#include <string>

namespace forecast::runtime::config {
class ObservabilityConfig;
}

namespace forecast::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpSettings {
  std::string endpoint;
  bool        http = false;
  bool        use_tls = false;
  std::string service_name;
};

/*
  Endpoint precedence: observability.otlp_endpoint, then the per-signal
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT
  (for HTTP a base URL that gets the signal path appended), then the
  collector defaults on localhost.
*/
OtlpSettings ResolveOtlpSettings(const forecast::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace forecast::observability
