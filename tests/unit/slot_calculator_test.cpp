#include "internal/availability/slot_calculator.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using booking::availability::ScheduleSnapshot;
using booking::availability::SlotCalculator;
using booking::db::model::AvailabilityWindowRecord;
using booking::db::model::BlockedSlotRecord;
using booking::db::model::BookingRecord;
using booking::model::BookingStatus;

// 2030-01-07 is a Monday.
constexpr const char* kMonday = "2030-01-07";

AvailabilityWindowRecord Window(uint32_t day_of_week, uint32_t start, uint32_t end, bool active = true) {
  AvailabilityWindowRecord window;
  window.id           = "w-" + std::to_string(day_of_week) + "-" + std::to_string(start);
  window.provider_id  = "provider-1";
  window.day_of_week  = day_of_week;
  window.start_minute = start;
  window.end_minute   = end;
  window.active       = active;
  return window;
}

BookingRecord Booked(const std::string& id, uint32_t start, uint32_t end, BookingStatus status = BookingStatus::kConfirmed) {
  BookingRecord booking;
  booking.id           = id;
  booking.provider_id  = "provider-1";
  booking.date         = kMonday;
  booking.start_minute = start;
  booking.end_minute   = end;
  booking.status       = status;
  return booking;
}

void TestNineToFiveHourlySlots() {
  ScheduleSnapshot snapshot;
  snapshot.windows.push_back(Window(1, 9 * 60, 17 * 60));

  const auto slots = SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 60);
  assert(slots.size() == 8);
  assert(slots.front().start_minute == 9 * 60);
  assert(slots.back().end_minute == 17 * 60);
  for (const auto& slot : slots) {
    assert(slot.available);
    assert(slot.end_minute - slot.start_minute == 60);
  }
}

void TestOtherWeekdayHasNoSlots() {
  ScheduleSnapshot snapshot;
  snapshot.windows.push_back(Window(2, 9 * 60, 17 * 60));

  assert(SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 60).empty());
}

void TestTrailingPartialSlotDroppedPerWindow() {
  ScheduleSnapshot snapshot;
  snapshot.windows.push_back(Window(1, 13 * 60, 17 * 60));
  snapshot.windows.push_back(Window(1, 9 * 60, 12 * 60));
  snapshot.windows.push_back(Window(1, 18 * 60, 20 * 60, false));

  const auto slots = SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 90);
  assert(slots.size() == 4);
  assert(slots[0].start_minute == 9 * 60);
  assert(slots[1].start_minute == 10 * 60 + 30);
  assert(slots[2].start_minute == 13 * 60);
  assert(slots[3].start_minute == 14 * 60 + 30);
  assert(slots[3].end_minute == 16 * 60);
}

void TestOccupyingBookingMarksSlotUnavailable() {
  ScheduleSnapshot snapshot;
  snapshot.windows.push_back(Window(1, 9 * 60, 17 * 60));
  snapshot.bookings.push_back(Booked("b-1", 14 * 60, 15 * 60));
  snapshot.bookings.push_back(Booked("b-2", 10 * 60, 11 * 60, BookingStatus::kCancelled));

  const auto slots = SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 60);
  for (const auto& slot : slots) {
    assert(slot.available == (slot.start_minute != 14 * 60));
  }
}

void TestBlocksRemoveSlots() {
  ScheduleSnapshot snapshot;
  snapshot.windows.push_back(Window(1, 9 * 60, 12 * 60));

  BlockedSlotRecord lunch;
  lunch.id           = "blk-1";
  lunch.provider_id  = "provider-1";
  lunch.date         = kMonday;
  lunch.full_day     = false;
  lunch.start_minute = 10 * 60 + 30;
  lunch.end_minute   = 11 * 60;
  snapshot.blocks.push_back(lunch);

  auto slots = SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 60);
  assert(slots.size() == 3);
  assert(slots[0].available);
  assert(!slots[1].available);
  assert(slots[2].available);

  BlockedSlotRecord day_off;
  day_off.id          = "blk-2";
  day_off.provider_id = "provider-1";
  day_off.date        = kMonday;
  day_off.full_day    = true;
  snapshot.blocks.push_back(day_off);

  slots = SlotCalculator::SlotsForDate(snapshot, booking::util::ParseDate(kMonday), 60);
  for (const auto& slot : slots) {
    assert(!slot.available);
  }
}

void TestCollisionRules() {
  // existing 14:00-15:00
  assert(SlotCalculator::Collides(840, 900, 870, 930));  // starts inside
  assert(SlotCalculator::Collides(840, 900, 810, 870));  // ends inside
  assert(SlotCalculator::Collides(840, 900, 780, 960));  // swallows
  assert(SlotCalculator::Collides(840, 900, 840, 900));  // identical
  assert(!SlotCalculator::Collides(840, 900, 900, 960)); // back to back
  assert(!SlotCalculator::Collides(840, 900, 780, 840));

  std::vector<BookingRecord> bookings{Booked("b-1", 840, 900)};
  const auto*                hit = SlotCalculator::FindConflict(bookings, kMonday, 870, 930);
  assert(hit != nullptr && hit->id == "b-1");
  assert(SlotCalculator::FindConflict(bookings, "2030-01-08", 870, 930) == nullptr);
}

void TestFitsWindow() {
  std::vector<AvailabilityWindowRecord> windows{Window(1, 9 * 60, 12 * 60), Window(1, 13 * 60, 17 * 60)};

  assert(SlotCalculator::FitsWindow(windows, 1, 9 * 60, 12 * 60));
  assert(SlotCalculator::FitsWindow(windows, 1, 13 * 60 + 15, 14 * 60));
  assert(!SlotCalculator::FitsWindow(windows, 1, 11 * 60 + 30, 13 * 60 + 30)); // spans the gap
  assert(!SlotCalculator::FitsWindow(windows, 2, 9 * 60, 10 * 60));
}

} // namespace

int main() {
  TestNineToFiveHourlySlots();
  TestOtherWeekdayHasNoSlots();
  TestTrailingPartialSlotDroppedPerWindow();
  TestOccupyingBookingMarksSlotUnavailable();
  TestBlocksRemoveSlots();
  TestCollisionRules();
  TestFitsWindow();

  std::cout << "booking_engine_unit_slot_calculator: pass\n";
  return 0;
}
