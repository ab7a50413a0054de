#include "housekeeping_worker.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/lock/slot_lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payout/payout_scheduler.hpp"
#include "internal/util/time.hpp"

namespace booking::worker {

namespace {

constexpr std::chrono::milliseconds kMinInterval{100};

std::vector<HousekeepingJob> EngineJobs(std::shared_ptr<payout::PayoutScheduler> payouts, std::shared_ptr<lock::SlotLockManager> locks,
                                        const HousekeepingOptions& options) {
  std::vector<HousekeepingJob> jobs;
  if (payouts) {
    jobs.push_back({"payout pass", options.payout_interval, [payouts] { payouts->ProcessDue(util::Now()); }});
  }
  if (locks) {
    jobs.push_back({"slot lock sweep", options.sweep_interval, [locks] { locks->Sweep(util::Now()); }});
  }
  return jobs;
}

} // namespace

HousekeepingWorker::HousekeepingWorker(std::shared_ptr<payout::PayoutScheduler> payouts, std::shared_ptr<lock::SlotLockManager> locks,
                                       HousekeepingOptions options)
    : HousekeepingWorker(EngineJobs(std::move(payouts), std::move(locks), options)) {
}

HousekeepingWorker::HousekeepingWorker(std::vector<HousekeepingJob> jobs) {
  for (auto& job : jobs) {
    if (!job.run) {
      continue;
    }
    job.interval = std::max(job.interval, kMinInterval);
    jobs_.push_back(ScheduledJob{std::move(job), {}});
  }
}

HousekeepingWorker::~HousekeepingWorker() {
  Stop();
}

void HousekeepingWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_  = std::thread(&HousekeepingWorker::Run, this);
  BOOKING_LOG_INFO("housekeeping worker started", {observability::IntField("jobs", static_cast<int64_t>(jobs_.size()))});
}

void HousekeepingWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  BOOKING_LOG_INFO("housekeeping worker stopped");
}

bool HousekeepingWorker::Running() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t HousekeepingWorker::RunOnce(std::chrono::steady_clock::time_point now) {
  std::size_t ran = 0;
  for (auto& scheduled : jobs_) {
    if (now < scheduled.next_run) {
      continue;
    }
    scheduled.next_run = now + scheduled.job.interval;
    ++ran;
    try {
      scheduled.job.run();
    } catch (const std::exception& e) {
      failed_passes_.fetch_add(1);
      BOOKING_LOG_ERROR("housekeeping job failed",
                        {observability::StringField("job", scheduled.job.name), observability::StringField("error", e.what())});
    }
  }
  return ran;
}

void HousekeepingWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    lock.unlock();
    RunOnce(std::chrono::steady_clock::now());
    lock.lock();

    if (jobs_.empty()) {
      cv_.wait(lock, [this] { return !running_; });
      break;
    }
    auto wake = jobs_.front().next_run;
    for (const auto& scheduled : jobs_) {
      wake = std::min(wake, scheduled.next_run);
    }
    cv_.wait_until(lock, wake, [this] { return !running_; });
  }
}

} // namespace booking::worker
