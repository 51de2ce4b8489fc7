#include "internal/external/simulated_external_system.hpp"

#include <algorithm>
#include <thread>

namespace forecast::external {

namespace {

constexpr auto kDelaySlice = std::chrono::milliseconds(5);

} // namespace

SimulatedExternalSystem::SimulatedExternalSystem() : SimulatedExternalSystem(Options{}) {
}

SimulatedExternalSystem::SimulatedExternalSystem(Options options) : options_(std::move(options)) {
}

bool SimulatedExternalSystem::Delay(const CallContext& ctx) const {
  std::chrono::milliseconds latency;
  {
    std::lock_guard lock(mutex_);
    latency = options_.latency;
  }

  const auto until = std::chrono::steady_clock::now() + latency;
  while (std::chrono::steady_clock::now() < until) {
    if (ctx.Expired()) {
      return false;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kDelaySlice, until - std::chrono::steady_clock::now()));
  }
  return !ctx.Expired();
}

std::optional<SimulatedExternalSystem::Failure> SimulatedExternalSystem::TakeFailure(Operation op) {
  auto& queue = op == Operation::kFetch ? fetch_failures_ : push_failures_;
  if (queue.empty()) {
    return std::nullopt;
  }
  auto failure = queue.front();
  queue.pop_front();
  return failure;
}

RemoteState SimulatedExternalSystem::FetchCurrentState(const std::string& organization_id, const std::string& entity_id, const CallContext& ctx) {
  {
    std::lock_guard lock(mutex_);
    ++fetch_calls_;
  }

  if (!Delay(ctx)) {
    return RemoteState{.status = CallStatus::kTransient, .error = "deadline exceeded"};
  }

  std::lock_guard lock(mutex_);
  if (auto failure = TakeFailure(Operation::kFetch)) {
    return RemoteState{.status = failure->status, .error = failure->error};
  }

  auto it = records_.find({organization_id, entity_id});
  if (it == records_.end()) {
    if (options_.reject_unknown) {
      return RemoteState{.status = CallStatus::kRejected, .error = "unknown entity " + entity_id};
    }
    return RemoteState{.status = CallStatus::kOk, .exists = false};
  }

  return RemoteState{
      .status           = CallStatus::kOk,
      .document         = it->second.document,
      .version          = it->second.version,
      .last_modified_by = it->second.last_modified_by,
  };
}

PushResult SimulatedExternalSystem::PushDelta(const std::string& organization_id, const std::string& entity_id, const model::Document& delta,
                                              uint64_t expected_base_version, const CallContext& ctx) {
  {
    std::lock_guard lock(mutex_);
    ++push_calls_;
  }

  if (!Delay(ctx)) {
    return PushResult{.status = CallStatus::kTransient, .error = "deadline exceeded"};
  }

  std::lock_guard lock(mutex_);
  if (auto failure = TakeFailure(Operation::kPush)) {
    return PushResult{.status = failure->status, .error = failure->error};
  }

  auto it = records_.find({organization_id, entity_id});
  if (it == records_.end()) {
    if (options_.reject_unknown) {
      return PushResult{.status = CallStatus::kRejected, .error = "unknown entity " + entity_id};
    }
    it = records_.emplace(Key{organization_id, entity_id}, Record{.version = expected_base_version}).first;
  }

  auto& record = it->second;
  if (record.version != expected_base_version) {
    return PushResult{
        .status      = CallStatus::kConflict,
        .new_version = record.version,
        .error       = "expected version " + std::to_string(expected_base_version) + ", found " + std::to_string(record.version),
    };
  }

  record.document         = model::Merge(record.document, delta);
  record.version          = record.version + 1;
  record.last_modified_by = "forecast-sync";

  PushResult result{.status = CallStatus::kOk, .new_version = record.version};
  if (options_.echo_confirmed) {
    result.confirmed = record.document;
  }
  return result;
}

void SimulatedExternalSystem::Seed(const std::string& organization_id, const std::string& entity_id, model::Document document, uint64_t version,
                                   std::string modified_by) {
  std::lock_guard lock(mutex_);
  records_[{organization_id, entity_id}] = Record{std::move(document), version, std::move(modified_by)};
}

uint64_t SimulatedExternalSystem::ApplyRemoteEdit(const std::string& organization_id, const std::string& entity_id, const model::Document& changes,
                                                  const std::string& modified_by) {
  std::lock_guard lock(mutex_);
  auto&           record = records_[{organization_id, entity_id}];
  record.document         = model::Merge(record.document, changes);
  record.version          = record.version + 1;
  record.last_modified_by = modified_by;
  return record.version;
}

std::optional<SimulatedExternalSystem::Record> SimulatedExternalSystem::Get(const std::string& organization_id, const std::string& entity_id) const {
  std::lock_guard lock(mutex_);
  auto            it = records_.find({organization_id, entity_id});
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SimulatedExternalSystem::InjectFailure(Operation op, CallStatus status, std::size_t times, std::string error) {
  std::lock_guard lock(mutex_);
  auto&           queue = op == Operation::kFetch ? fetch_failures_ : push_failures_;
  for (std::size_t i = 0; i < times; ++i) {
    queue.push_back(Failure{status, error});
  }
}

void SimulatedExternalSystem::SetLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  options_.latency = latency;
}

std::size_t SimulatedExternalSystem::FetchCalls() const {
  std::lock_guard lock(mutex_);
  return fetch_calls_;
}

std::size_t SimulatedExternalSystem::PushCalls() const {
  std::lock_guard lock(mutex_);
  return push_calls_;
}

} // namespace forecast::external
