#pragma once

#include <chrono>
#include <cstdint>

namespace booking::core {

struct BookingOptions {
  // Cancelling a CONFIRMED booking closer than this to its start costs a fee.
  std::chrono::milliseconds late_cancel_window{std::chrono::hours(24)};
  uint32_t                  late_cancel_fee_percent  = 25;
  uint32_t                  confirmation_code_length = 6;
  uint32_t                  max_commit_attempts      = 5;
};

} // namespace booking::core
