#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "internal/model/document.hpp"

namespace forecast::external {

enum class CallStatus {
  kOk,
  // Expected base version no longer matches the system of record.
  kConflict,
  // Timeouts, unavailability, throttling. Worth retrying.
  kTransient,
  // The system of record refused the request. Retrying will not help.
  kRejected,
};

constexpr std::string_view ToString(CallStatus status) {
  switch (status) {
    case CallStatus::kOk:
      return "ok";
    case CallStatus::kConflict:
      return "conflict";
    case CallStatus::kTransient:
      return "transient";
    case CallStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

// Deadline and cancellation for one outbound call.
struct CallContext {
  std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
  std::stop_token                       stop;

  bool Expired() const {
    return stop.stop_requested() || std::chrono::steady_clock::now() >= deadline;
  }
};

struct RemoteState {
  CallStatus status = CallStatus::kOk;

  // False when the system of record has no such entity yet and would
  // create it on the first push.
  bool            exists = true;
  model::Document document;
  uint64_t        version = 0;
  std::string     last_modified_by;
  std::string     error;
};

struct PushResult {
  CallStatus status = CallStatus::kOk;

  // Full record as the system of record stored it, when it echoes one.
  std::optional<model::Document> confirmed;
  uint64_t                        new_version = 0;
  std::string                     error;
};

/*
  Outbound capability to the external system of record.

  Implementations report failures through the status fields. An exception
  escaping a call is treated by callers as a transient failure.
*/
class ExternalSystemClient {
 public:
  virtual ~ExternalSystemClient() = default;

  virtual RemoteState FetchCurrentState(const std::string& organization_id, const std::string& entity_id, const CallContext& ctx) = 0;

  virtual PushResult PushDelta(const std::string& organization_id, const std::string& entity_id, const model::Document& delta,
                               uint64_t expected_base_version, const CallContext& ctx) = 0;
};

} // namespace forecast::external
