#include <cassert>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <thread>
#include <vector>

#include "internal/sync/rate_limiter.hpp"

namespace {

using forecast::sync::RateLimiter;
using Clock = RateLimiter::Clock;
using namespace std::chrono_literals;

void TestUnlimitedNeverWaits() {
  RateLimiter limiter(0);
  const auto  start = Clock::now();
  for (int i = 0; i < 1000; ++i) {
    assert(limiter.Acquire());
  }
  assert(Clock::now() - start < 500ms);
}

void TestPacesToRate() {
  RateLimiter limiter(100); // one slot per 10ms
  const auto  start = Clock::now();
  for (int i = 0; i < 11; ++i) {
    assert(limiter.Acquire());
  }
  // The first slot is free; ten more intervals follow.
  assert(Clock::now() - start >= 95ms);
}

void TestBurstAfterIdle() {
  RateLimiter limiter(10, 3);
  std::this_thread::sleep_for(50ms);

  const auto start = Clock::now();
  for (int i = 0; i < 3; ++i) {
    assert(limiter.Acquire());
  }
  assert(Clock::now() - start < 50ms);
}

void TestDeadlineRefusesWithoutConsuming() {
  RateLimiter limiter(1); // one slot per second
  assert(limiter.Acquire());

  assert(!limiter.Acquire({}, Clock::now() + 100ms));

  // The refused call did not push the next slot further out.
  const auto start = Clock::now();
  assert(limiter.Acquire({}, Clock::now() + 2s));
  assert(Clock::now() - start <= 1100ms);
}

void TestStopEndsWait() {
  RateLimiter      limiter(0.5); // one slot per two seconds
  std::stop_source stop;
  assert(limiter.Acquire());

  std::thread stopper([&] {
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
  });

  const auto start = Clock::now();
  assert(!limiter.Acquire(stop.get_token()));
  assert(Clock::now() - start < 1s);
  stopper.join();

  // An already stopped token never waits.
  assert(!limiter.Acquire(stop.get_token()));
}

void TestSharedAcrossThreads() {
  RateLimiter              limiter(200); // 5ms slots
  std::vector<std::thread> threads;
  const auto               start = Clock::now();
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 5; ++i) assert(limiter.Acquire());
    });
  }
  for (auto& thread : threads) thread.join();

  // 20 acquisitions spaced 5ms apart, the first one free.
  assert(Clock::now() - start >= 90ms);
}

} // namespace

int main() {
  TestUnlimitedNeverWaits();
  TestPacesToRate();
  TestBurstAfterIdle();
  TestDeadlineRefusesWithoutConsuming();
  TestStopEndsWait();
  TestSharedAcrossThreads();

  std::cout << "rate_limiter_test: pass\n";
  return 0;
}
