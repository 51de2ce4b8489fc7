#include "scheduler.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forecast::runtime {

using observability::IntField;
using observability::StringField;

namespace {

int64_t ToWallMillis(std::chrono::steady_clock::time_point tp) {
  const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(tp - std::chrono::steady_clock::now());
  return util::ToUnixMillis(util::Now()) + delta.count();
}

} // namespace

ScheduledJob::ScheduledJob(JobSpec spec) : spec_(std::move(spec)), enabled_(spec_.enabled) {
  if (spec_.name.empty()) {
    throw util::InvalidArgument("job name must not be empty");
  }
  if (!spec_.fn) {
    throw util::InvalidArgument("job " + spec_.name + " has no body");
  }
  if (spec_.interval.count() <= 0) {
    throw util::InvalidArgument("job " + spec_.name + " interval must be positive");
  }
}

ScheduledJob::~ScheduledJob() {
  Halt();
}

void ScheduledJob::Launch() {
  if (started_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&ScheduledJob::Loop, this, stop_source_.get_token());
}

void ScheduledJob::Halt() {
  stop_source_.request_stop();
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ScheduledJob::Loop(std::stop_token stop) {
  std::unique_lock lock(mutex_);
  next_run_ = std::chrono::steady_clock::now() + (spec_.run_immediately ? std::chrono::milliseconds(0) : spec_.interval);

  while (!stop.stop_requested()) {
    cv_.wait_until(lock, stop, next_run_, [&] { return trigger_; });
    if (stop.stop_requested()) {
      break;
    }

    const bool triggered = trigger_;
    trigger_             = false;
    if (!triggered && std::chrono::steady_clock::now() < next_run_) {
      continue;
    }
    if (!triggered && !enabled_) {
      next_run_ = std::chrono::steady_clock::now() + spec_.interval;
      continue;
    }

    running_ = true;
    lock.unlock();

    std::string error;
    {
      observability::SpanScope span("job." + spec_.name);
      try {
        spec_.fn(stop);
      } catch (const std::exception& ex) {
        error = ex.what();
        span.RecordException(error);
        FORECAST_LOG_ERROR("Scheduled job failed", {StringField("job", spec_.name), StringField("error", error)});
      }
    }

    lock.lock();
    running_     = false;
    last_run_ms_ = util::ToUnixMillis(util::Now());
    ++run_count_;
    if (!error.empty()) {
      ++failure_count_;
      last_error_ = std::move(error);
    }
    next_run_ = std::chrono::steady_clock::now() + spec_.interval;
    cv_.notify_all();
  }
}

void ScheduledJob::SetEnabled(bool enabled) {
  std::lock_guard lock(mutex_);
  enabled_ = enabled;
}

bool ScheduledJob::Enabled() const {
  std::lock_guard lock(mutex_);
  return enabled_;
}

int64_t ScheduledJob::NextRun() const {
  std::lock_guard lock(mutex_);
  if (!started_ || !enabled_) {
    return 0;
  }
  return ToWallMillis(next_run_);
}

int64_t ScheduledJob::LastRun() const {
  std::lock_guard lock(mutex_);
  return last_run_ms_;
}

uint64_t ScheduledJob::RunCount() const {
  std::lock_guard lock(mutex_);
  return run_count_;
}

void ScheduledJob::RunNow() {
  {
    std::lock_guard lock(mutex_);
    trigger_ = true;
  }
  cv_.notify_all();
}

bool ScheduledJob::WaitForRunCount(uint64_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return run_count_ >= count; });
}

JobStatus ScheduledJob::Status() const {
  const auto next = NextRun();

  std::lock_guard lock(mutex_);
  return JobStatus{
      .name          = spec_.name,
      .enabled       = enabled_,
      .running       = running_,
      .next_run_ms   = next,
      .last_run_ms   = last_run_ms_,
      .run_count     = run_count_,
      .failure_count = failure_count_,
      .last_error    = last_error_,
  };
}

JobScheduler::~JobScheduler() {
  StopAll();
}

std::shared_ptr<ScheduledJob> JobScheduler::Start(JobSpec spec) {
  auto job = std::make_shared<ScheduledJob>(std::move(spec));
  {
    std::lock_guard lock(mutex_);
    const bool      taken = std::any_of(jobs_.begin(), jobs_.end(), [&](const auto& other) { return other->Name() == job->Name(); });
    if (taken) {
      throw util::AlreadyExists("job " + job->Name() + " is already scheduled");
    }
    jobs_.push_back(job);
  }

  job->Launch();
  FORECAST_LOG_INFO("Job scheduled", {StringField("job", job->Name()), IntField("interval_ms", job->spec_.interval.count())});
  return job;
}

void JobScheduler::Stop(const std::shared_ptr<ScheduledJob>& job) {
  if (!job) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    std::erase(jobs_, job);
  }
  job->Halt();
}

void JobScheduler::StopAll() {
  std::vector<std::shared_ptr<ScheduledJob>> jobs;
  {
    std::lock_guard lock(mutex_);
    jobs.swap(jobs_);
  }
  for (const auto& job : jobs) {
    job->Halt();
  }
}

std::vector<std::shared_ptr<ScheduledJob>> JobScheduler::Jobs() const {
  std::lock_guard lock(mutex_);
  return jobs_;
}

std::shared_ptr<ScheduledJob> JobScheduler::Find(const std::string& name) const {
  std::lock_guard lock(mutex_);
  for (const auto& job : jobs_) {
    if (job->Name() == name) {
      return job;
    }
  }
  return nullptr;
}

} // namespace forecast::runtime
