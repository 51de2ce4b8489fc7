#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace forecast::service {

/*
  Wraps one RPC body in a span, request metrics and failure logging.
  Exceptions are logged and rethrown for the transport to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view organization_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!organization_id.empty()) {
    span.SetAttribute("organization.id", organization_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRequest(route, success);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FORECAST_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::StringField("organization_id", organization_id)});
    record(false);
    throw;
  }
}

} // namespace forecast::service
