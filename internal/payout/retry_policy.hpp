#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace booking::payout {

/*
  Decides when a payout that failed with a transient error runs again.

  attempt is the retry count after the failure (1 for the first retry).
  A payout whose retry count exceeds MaxRetries() fails terminally.
*/
class RetryPolicy {
 public:
  virtual ~RetryPolicy() = default;

  virtual std::chrono::milliseconds Backoff(uint32_t attempt) const = 0;
  virtual uint32_t                  MaxRetries() const             = 0;
};

// Table-driven backoff; attempts past the end reuse the last delay.
class ScheduleRetryPolicy final : public RetryPolicy {
 public:
  ScheduleRetryPolicy();
  ScheduleRetryPolicy(std::vector<std::chrono::milliseconds> schedule, uint32_t max_retries);

  std::chrono::milliseconds Backoff(uint32_t attempt) const override;
  uint32_t                  MaxRetries() const override {
    return max_retries_;
  }

 private:
  std::vector<std::chrono::milliseconds> schedule_;
  uint32_t                               max_retries_;
};

} // namespace booking::payout
