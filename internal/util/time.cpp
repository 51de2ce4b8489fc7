#include "time.hpp"

namespace forecast::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Timestamp TimestampFromUnixMillis(int64_t unix_ms) {
  google::protobuf::Timestamp ts;
  int64_t                     seconds = unix_ms / 1000;
  int64_t                     millis  = unix_ms % 1000;
  if (millis < 0) {
    --seconds;
    millis += 1000;
  }
  ts.set_seconds(seconds);
  ts.set_nanos(static_cast<int32_t>(millis * 1'000'000));
  return ts;
}

int64_t UnixMillisFromProto(const google::protobuf::Timestamp& ts) {
  return ts.seconds() * 1000 + ts.nanos() / 1'000'000;
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) {
    return fallback;
  }
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1'000'000);
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace forecast::util
