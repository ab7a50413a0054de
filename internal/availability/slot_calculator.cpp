#include "slot_calculator.hpp"

#include <algorithm>
#include <tuple>

namespace booking::availability {

std::vector<model::TimeSlot> SlotCalculator::SlotsForDate(const ScheduleSnapshot& snapshot, util::Date date, uint32_t duration_minutes) {
  std::vector<model::TimeSlot> slots;
  if (duration_minutes == 0) {
    return slots;
  }

  const auto     date_key    = util::FormatDate(date);
  const unsigned day_of_week = util::DayOfWeek(date);

  for (const auto& window : snapshot.windows) {
    if (!window.active || window.day_of_week != day_of_week) {
      continue;
    }
    for (uint32_t start = window.start_minute; start + duration_minutes <= window.end_minute; start += duration_minutes) {
      const uint32_t end = start + duration_minutes;

      model::TimeSlot slot;
      slot.date         = date;
      slot.start_minute = start;
      slot.end_minute   = end;
      slot.available    = !IsBlocked(snapshot.blocks, date_key, start, end) && FindConflict(snapshot.bookings, date_key, start, end) == nullptr;
      slots.push_back(slot);
    }
  }

  std::sort(slots.begin(), slots.end(), [](const model::TimeSlot& a, const model::TimeSlot& b) {
    return std::tie(a.start_minute, a.end_minute) < std::tie(b.start_minute, b.end_minute);
  });
  return slots;
}

bool SlotCalculator::IsBlocked(const std::vector<db::model::BlockedSlotRecord>& blocks, const std::string& date, uint32_t start, uint32_t end) {
  for (const auto& block : blocks) {
    if (block.date != date) {
      continue;
    }
    if (block.full_day || model::Overlaps(block.start_minute, block.end_minute, start, end)) {
      return true;
    }
  }
  return false;
}

bool SlotCalculator::FitsWindow(const std::vector<db::model::AvailabilityWindowRecord>& windows, unsigned day_of_week, uint32_t start,
                                uint32_t end) {
  return std::any_of(windows.begin(), windows.end(), [&](const db::model::AvailabilityWindowRecord& window) {
    return window.active && window.day_of_week == day_of_week && window.start_minute <= start && end <= window.end_minute;
  });
}

const db::model::BookingRecord* SlotCalculator::FindConflict(const std::vector<db::model::BookingRecord>& bookings, const std::string& date,
                                                             uint32_t start, uint32_t end) {
  for (const auto& booking : bookings) {
    if (booking.date != date || !model::OccupiesSlot(booking.status)) {
      continue;
    }
    if (Collides(booking.start_minute, booking.end_minute, start, end)) {
      return &booking;
    }
  }
  return nullptr;
}

bool SlotCalculator::Collides(uint32_t existing_start, uint32_t existing_end, uint32_t start, uint32_t end) {
  const bool starts_inside = start >= existing_start && start < existing_end;
  const bool ends_inside   = end > existing_start && end <= existing_end;
  const bool contains      = start <= existing_start && end >= existing_end;
  return starts_inside || ends_inside || contains;
}

} // namespace booking::availability
