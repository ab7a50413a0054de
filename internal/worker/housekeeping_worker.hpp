#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace booking::payout {
class PayoutScheduler;
}
namespace booking::lock {
class SlotLockManager;
}

namespace booking::worker {

struct HousekeepingOptions {
  std::chrono::milliseconds payout_interval{std::chrono::minutes(1)};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes(1)};
};

struct HousekeepingJob {
  std::string               name;
  std::chrono::milliseconds interval{std::chrono::minutes(1)};
  std::function<void()>     run;
};

/*
  Background worker for periodic batch jobs.

  Executes:
      due payouts  (PayoutScheduler::ProcessDue)
      lock sweep   (SlotLockManager::Sweep)

  Each job runs at most once per interval. A job that throws is logged and
  runs again on its next interval. Running several instances against one
  store is safe.
*/
class HousekeepingWorker {
 public:
  // Either collaborator may be null to skip its job.
  HousekeepingWorker(std::shared_ptr<payout::PayoutScheduler> payouts, std::shared_ptr<lock::SlotLockManager> locks, HousekeepingOptions options);
  explicit HousekeepingWorker(std::vector<HousekeepingJob> jobs);
  ~HousekeepingWorker();

  HousekeepingWorker(const HousekeepingWorker&)            = delete;
  HousekeepingWorker& operator=(const HousekeepingWorker&) = delete;

  void Start();
  void Stop();
  bool Running();

  // One pass of every job that is due. Returns how many ran.
  std::size_t RunOnce(std::chrono::steady_clock::time_point now);

  uint64_t FailedPasses() const {
    return failed_passes_.load();
  }

 private:
  struct ScheduledJob {
    HousekeepingJob                       job;
    std::chrono::steady_clock::time_point next_run{};
  };

  void Run();

  std::vector<ScheduledJob> jobs_;
  std::atomic<uint64_t>     failed_passes_{0};

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace booking::worker
