#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace forecast::runtime {

struct JobSpec {
  std::string               name;
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  bool                      enabled         = true;
  bool                      run_immediately = false;

  // Receives a token that fires when the job is stopped.
  std::function<void(std::stop_token)> fn;
};

struct JobStatus {
  std::string name;
  bool        enabled       = false;
  bool        running       = false;
  int64_t     next_run_ms   = 0;
  int64_t     last_run_ms   = 0;
  uint64_t    run_count     = 0;
  uint64_t    failure_count = 0;
  std::string last_error;
};

/*
  One periodic job on its own thread.

  Runs never overlap. A disabled job keeps its thread but skips its
  interval ticks; RunNow still runs it.
*/
class ScheduledJob {
 public:
  explicit ScheduledJob(JobSpec spec);
  ~ScheduledJob();

  ScheduledJob(const ScheduledJob&)            = delete;
  ScheduledJob& operator=(const ScheduledJob&) = delete;

  const std::string& Name() const {
    return spec_.name;
  }

  void SetEnabled(bool enabled);
  bool Enabled() const;

  // Wall-clock unix ms; 0 when the job has not run yet.
  int64_t NextRun() const;
  int64_t LastRun() const;

  uint64_t RunCount() const;

  // Runs the job as soon as the current run, if any, finishes.
  void RunNow();

  // Blocks until at least `count` runs completed or `timeout` passed.
  bool WaitForRunCount(uint64_t count, std::chrono::milliseconds timeout) const;

  JobStatus Status() const;

 private:
  friend class JobScheduler;

  void Launch();
  void Halt();
  void Loop(std::stop_token stop);

  JobSpec spec_;

  mutable std::mutex                  mutex_;
  mutable std::condition_variable_any cv_;

  bool                                  enabled_;
  bool                                  running_ = false;
  bool                                  trigger_ = false;
  std::chrono::steady_clock::time_point next_run_{};
  int64_t                               last_run_ms_   = 0;
  uint64_t                              run_count_     = 0;
  uint64_t                              failure_count_ = 0;
  std::string                           last_error_;

  std::stop_source  stop_source_;
  std::thread       thread_;
  std::atomic<bool> started_{false};
};

/*
  Owns job threads. Handles come back from Start and go into Stop; nothing
  is registered globally.
*/
class JobScheduler {
 public:
  JobScheduler() = default;
  ~JobScheduler();

  JobScheduler(const JobScheduler&)            = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  std::shared_ptr<ScheduledJob> Start(JobSpec spec);

  void Stop(const std::shared_ptr<ScheduledJob>& job);
  void StopAll();

  std::vector<std::shared_ptr<ScheduledJob>> Jobs() const;

  // nullptr when no running job has that name.
  std::shared_ptr<ScheduledJob> Find(const std::string& name) const;

 private:
  mutable std::mutex                         mutex_;
  std::vector<std::shared_ptr<ScheduledJob>> jobs_;
};

} // namespace forecast::runtime
