#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace forecast::util {

/*
  Time utilities.

  Wall-clock reads go through a TimeSource so jobs and tests can share a
  controllable clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp TimestampFromUnixMillis(int64_t unix_ms);
int64_t                     UnixMillisFromProto(const google::protobuf::Timestamp& ts);

// Duration fields left unset in config fall back to `fallback`.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

int64_t ToUnixMillis(TimePoint tp);

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual int64_t NowMillis() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  int64_t NowMillis() const override {
    return ToUnixMillis(Now());
  }
};

// Clock that only moves when told to.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(int64_t now_ms) : now_ms_(now_ms) {
  }

  int64_t NowMillis() const override {
    return now_ms_.load();
  }

  void Set(int64_t now_ms) {
    now_ms_ = now_ms;
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms_ += by.count();
  }

 private:
  std::atomic<int64_t> now_ms_;
};

} // namespace forecast::util
