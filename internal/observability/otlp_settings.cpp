#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace forecast::observability {
namespace {

constexpr const char* kDefaultServiceName = "forecast-sync";

const char* SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string{};
}

} // namespace

OtlpSettings ResolveOtlpSettings(const forecast::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpSettings settings;
  settings.http         = config.transport() == forecast::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.use_tls      = config.use_tls();
  settings.service_name = config.service_name().empty() ? kDefaultServiceName : config.service_name();

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
    return settings;
  }
  if (auto endpoint = NonEmptyEnv(SignalEnv(signal)); !endpoint.empty()) {
    settings.endpoint = std::move(endpoint);
    return settings;
  }
  if (auto base = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT"); !base.empty()) {
    if (settings.http) {
      while (!base.empty() && base.back() == '/') {
        base.pop_back();
      }
      base += SignalPath(signal);
    }
    settings.endpoint = std::move(base);
    return settings;
  }

  settings.endpoint = settings.http ? std::string("http://localhost:4318") + SignalPath(signal) : std::string("localhost:4317");
  return settings;
}

} // namespace forecast::observability
