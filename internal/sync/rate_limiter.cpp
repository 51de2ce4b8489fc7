#include "rate_limiter.hpp"

#include <algorithm>

namespace forecast::sync {

RateLimiter::RateLimiter(double per_second, unsigned burst) : per_second_(per_second) {
  if (per_second_ > 0) {
    interval_     = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / per_second_));
    burst_window_ = interval_ * (std::max(burst, 1u) - 1);
  }
}

bool RateLimiter::Acquire(std::stop_token stop, Clock::time_point deadline) {
  if (stop.stop_requested()) {
    return false;
  }
  if (per_second_ <= 0) {
    return true;
  }

  std::unique_lock lock(mutex_);
  const auto       now  = Clock::now();
  const auto       slot = std::max(next_slot_, now - burst_window_);
  if (slot > deadline) {
    return false;
  }
  next_slot_ = slot + interval_;

  if (slot <= now) {
    return true;
  }

  // Only a stop request ends the wait early.
  cv_.wait_until(lock, stop, slot, [] { return false; });
  return !stop.stop_requested();
}

} // namespace forecast::sync
