#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace forecast::sync {

/*
  Paces outbound calls to a fixed rate shared by every caller.

  Each Acquire reserves the next free slot and sleeps until it. `burst`
  slots may be taken back to back after an idle period. A rate of zero or
  less disables pacing.
*/
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(double per_second, unsigned burst = 1);

  // False when the slot would land past `deadline` or `stop` fires while
  // waiting; no slot is consumed in the first case.
  bool Acquire(std::stop_token stop = {}, Clock::time_point deadline = Clock::time_point::max());

  double Rate() const {
    return per_second_;
  }

 private:
  double            per_second_;
  Clock::duration   interval_{};
  Clock::duration   burst_window_{};
  Clock::time_point next_slot_{};

  std::mutex                  mutex_;
  std::condition_variable_any cv_;
};

} // namespace forecast::sync
