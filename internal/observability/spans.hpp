#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace forecast::runtime::config {
class RuntimeConfig;
}

namespace forecast::observability {

// Both return false, leaving the no-op providers in place, when the
// signal is disabled in observability config.
bool InitializeTracing(const forecast::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const forecast::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  template <typename Fn>
  void WithSpan(Fn&& fn);

  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: synced | conflict | retried | failed | released
  void RecordSyncOutcome(std::string_view outcome, std::uint64_t count);
  void ObserveSyncCycleDurationMs(double duration_ms);

  // action: archived | deleted | errors
  void RecordRetentionRecords(std::string_view action, std::uint64_t count);
  void ObserveRetentionDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const forecast::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const forecast::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordSyncOutcome(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveSyncCycleDurationMs(double) {
}

inline void Metrics::RecordRetentionRecords(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveRetentionDurationMs(double) {
}
#endif

} // namespace forecast::observability
