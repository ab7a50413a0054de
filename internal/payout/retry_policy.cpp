#include "retry_policy.hpp"

#include <algorithm>

namespace booking::payout {

using namespace std::chrono_literals;

ScheduleRetryPolicy::ScheduleRetryPolicy() : ScheduleRetryPolicy({1h, 6h, 24h}, 3) {
}

ScheduleRetryPolicy::ScheduleRetryPolicy(std::vector<std::chrono::milliseconds> schedule, uint32_t max_retries)
    : schedule_(std::move(schedule)), max_retries_(max_retries) {
  if (schedule_.empty()) {
    schedule_ = {1h, 6h, 24h};
  }
}

std::chrono::milliseconds ScheduleRetryPolicy::Backoff(uint32_t attempt) const {
  if (attempt == 0) {
    attempt = 1;
  }
  const auto index = std::min<std::size_t>(attempt, schedule_.size()) - 1;
  return schedule_[index];
}

} // namespace booking::payout
