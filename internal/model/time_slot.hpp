#pragma once

#include <chrono>
#include <cstdint>

namespace booking::model {

/*
  Derived projection of a bookable interval. Never ground truth.

  Minutes are counted from the provider's local midnight.
*/
struct TimeSlot {
  std::chrono::year_month_day date{};
  std::uint32_t               start_minute = 0;
  std::uint32_t               end_minute   = 0;
  bool                        available    = false;
};

// Half-open [start, end) intersection.
constexpr bool Overlaps(std::uint32_t s1, std::uint32_t e1, std::uint32_t s2, std::uint32_t e2) {
  return s1 < e2 && s2 < e1;
}

constexpr std::uint32_t kMinutesPerDay = 24 * 60;

} // namespace booking::model
