#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "internal/external/external_system_client.hpp"

namespace forecast::external {

/*
  In-process system of record.

  Keeps one versioned document per (organization, entity) and applies
  pushes with optimistic concurrency on the version. Failures can be
  queued per operation, which is how tests drive the retry and conflict
  paths; the daemon uses it when no real client is configured.
*/
class SimulatedExternalSystem final : public ExternalSystemClient {
 public:
  enum class Operation { kFetch, kPush };

  struct Options {
    std::chrono::milliseconds latency{0};

    // Echo the stored record back from PushDelta.
    bool echo_confirmed = true;

    // Unknown entities are reported as rejected instead of being created
    // on first push.
    bool reject_unknown = true;
  };

  struct Record {
    model::Document document;
    uint64_t        version = 0;
    std::string     last_modified_by;
  };

  SimulatedExternalSystem();
  explicit SimulatedExternalSystem(Options options);

  RemoteState FetchCurrentState(const std::string& organization_id, const std::string& entity_id, const CallContext& ctx) override;

  PushResult PushDelta(const std::string& organization_id, const std::string& entity_id, const model::Document& delta,
                       uint64_t expected_base_version, const CallContext& ctx) override;

  // Replaces the stored record wholesale.
  void Seed(const std::string& organization_id, const std::string& entity_id, model::Document document, uint64_t version,
            std::string modified_by = "upstream");

  // An edit made directly in the system of record: overlays `changes` and
  // bumps the version.
  uint64_t ApplyRemoteEdit(const std::string& organization_id, const std::string& entity_id, const model::Document& changes,
                           const std::string& modified_by);

  std::optional<Record> Get(const std::string& organization_id, const std::string& entity_id) const;

  // The next `times` calls of `op` fail with `status`.
  void InjectFailure(Operation op, CallStatus status, std::size_t times = 1, std::string error = "injected failure");

  void SetLatency(std::chrono::milliseconds latency);

  std::size_t FetchCalls() const;
  std::size_t PushCalls() const;

 private:
  using Key = std::pair<std::string, std::string>;

  struct Failure {
    CallStatus  status;
    std::string error;
  };

  // Sleeps for the configured latency; false when the deadline or the stop
  // token fires first.
  bool Delay(const CallContext& ctx) const;

  std::optional<Failure> TakeFailure(Operation op);

  mutable std::mutex             mutex_;
  Options                        options_;
  std::map<Key, Record>          records_;
  std::deque<Failure>            fetch_failures_;
  std::deque<Failure>            push_failures_;
  std::size_t                    fetch_calls_ = 0;
  std::size_t                    push_calls_  = 0;
};

} // namespace forecast::external
