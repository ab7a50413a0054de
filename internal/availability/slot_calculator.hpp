#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/availability_window_record.hpp"
#include "internal/db/model/blocked_slot_record.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/model/time_slot.hpp"
#include "internal/util/time.hpp"

namespace booking::availability {

/*
  Everything slot generation needs for one provider over a date range,
  read inside a single transaction.

  bookings holds only slot-occupying rows.
*/
struct ScheduleSnapshot {
  std::vector<db::model::AvailabilityWindowRecord> windows;
  std::vector<db::model::BlockedSlotRecord>        blocks;
  std::vector<db::model::BookingRecord>            bookings;
};

/*
  Pure slot arithmetic. No clock, no store.
*/
class SlotCalculator {
 public:
  // Slots of `duration_minutes` for one date, ordered by start then end.
  // Each active window for the weekday is stepped independently and
  // trailing partial slots are dropped.
  static std::vector<model::TimeSlot> SlotsForDate(const ScheduleSnapshot& snapshot, util::Date date, uint32_t duration_minutes);

  // True when [start, end) intersects a block on `date` (full-day blocks cover everything).
  static bool IsBlocked(const std::vector<db::model::BlockedSlotRecord>& blocks, const std::string& date, uint32_t start, uint32_t end);

  // True when [start, end) lies inside a single active window for the weekday.
  static bool FitsWindow(const std::vector<db::model::AvailabilityWindowRecord>& windows, unsigned day_of_week, uint32_t start, uint32_t end);

  // First occupying booking on `date` that collides with [start, end), or nullptr.
  static const db::model::BookingRecord* FindConflict(const std::vector<db::model::BookingRecord>& bookings, const std::string& date,
                                                      uint32_t start, uint32_t end);

  // New interval starts inside, ends inside, or swallows the existing one.
  static bool Collides(uint32_t existing_start, uint32_t existing_end, uint32_t start, uint32_t end);
};

} // namespace booking::availability
