#include "internal/service/booking_service.hpp"

#include <cassert>
#include <iostream>

#include "internal/factory.hpp"
#include "internal/service/payout_admin_service.hpp"
#include "internal/service/schedule_service.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = booking::engine::v1;

using booking::service::BookingService;
using booking::service::PayoutAdminService;
using booking::service::ScheduleService;

constexpr const char* kProvider = "provider-1";
constexpr const char* kMonday   = "2030-01-07";
constexpr const char* kNextMon  = "2030-01-14";

struct Fixture {
  booking::factory::Runtime runtime;
  ScheduleService           schedule;
  BookingService            bookings;
  PayoutAdminService        payouts;

  Fixture()
      : runtime(booking::factory::BuildRuntime(booking::runtime::config::RuntimeConfig{}, nullptr)),
        schedule(runtime.services),
        bookings(runtime.services),
        payouts(runtime.services) {
    v1::UpsertProviderRequest provider;
    provider.mutable_provider()->set_id(kProvider);
    provider.mutable_provider()->set_display_name("Test Provider");
    (void)schedule.UpsertProvider(provider);

    v1::SetWeeklyScheduleRequest weekly;
    weekly.set_provider_id(kProvider);
    auto* window = weekly.add_windows();
    window->set_day_of_week(1);
    window->set_start_minute(9 * 60);
    window->set_end_minute(17 * 60);
    window->set_active(true);
    (void)schedule.SetWeeklySchedule(weekly);
  }

  v1::GetAvailabilityResponse Slots(const std::string& date) {
    v1::GetAvailabilityRequest req;
    req.set_provider_id(kProvider);
    req.set_date_from(date);
    req.set_date_to(date);
    req.set_duration_minutes(60);
    return bookings.GetAvailability(req);
  }

  v1::CreateBookingRequest Booking(uint32_t start, uint32_t end) const {
    v1::CreateBookingRequest req;
    req.set_provider_id(kProvider);
    req.set_customer_id("customer-1");
    req.set_date(kMonday);
    req.set_start_minute(start);
    req.set_end_minute(end);
    req.set_base_price_cents(10'000);
    return req;
  }
};

bool SlotAvailable(const v1::GetAvailabilityResponse& resp, uint32_t start) {
  for (const auto& slot : resp.slots()) {
    if (slot.start_minute() == start) {
      return slot.available();
    }
  }
  return false;
}

void TestLockBookAndReadBack() {
  Fixture f;

  auto slots = f.Slots(kMonday);
  assert(slots.slots_size() == 8);
  assert(SlotAvailable(slots, 10 * 60));

  v1::AcquireSlotLockRequest lock_req;
  lock_req.set_provider_id(kProvider);
  lock_req.set_date(kMonday);
  lock_req.set_start_minute(10 * 60);
  lock_req.set_end_minute(11 * 60);
  lock_req.set_session_id("session-a");
  lock_req.mutable_ttl()->set_seconds(300);
  auto lock = f.bookings.AcquireSlotLock(lock_req);
  assert(lock.acquired());
  assert(!lock.lock().lock_id().empty());

  auto create = f.Booking(10 * 60, 11 * 60);
  create.set_slot_lock_id(lock.lock().lock_id());
  const auto created = f.bookings.CreateBooking(create).booking();
  assert(created.status() == v1::BOOKING_STATUS_PENDING);
  assert(created.price().total_cents() == 10'000);
  assert(created.price().provider_payout_cents() == 9'000);
  assert(created.has_created_at());
  assert(!created.has_cancelled_at());

  assert(!SlotAvailable(f.Slots(kMonday), 10 * 60));

  v1::GetBookingRequest by_code;
  by_code.set_confirmation_code(created.confirmation_code());
  assert(f.bookings.GetBooking(by_code).booking().id() == created.id());

  v1::GetBookingRequest missing;
  missing.set_id("booking-missing");
  bool threw = false;
  try {
    (void)f.bookings.GetBooking(missing);
  } catch (const booking::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestOverlapSurfacesConflict() {
  Fixture f;

  const auto first = f.bookings.CreateBooking(f.Booking(14 * 60, 15 * 60)).booking();

  bool conflicted = false;
  try {
    (void)f.bookings.CreateBooking(f.Booking(14 * 60 + 30, 15 * 60 + 30));
  } catch (const booking::util::ConflictError& e) {
    conflicted = true;
    assert(e.BlockingBookingId() == first.id());
    assert(!e.Alternatives().empty());
  }
  assert(conflicted);

  v1::TransitionBookingRequest cancel;
  cancel.set_booking_id(first.id());
  cancel.set_target(v1::BOOKING_STATUS_CANCELLED);
  cancel.set_triggered_by("customer-1");
  cancel.set_reason("plans changed");
  const auto cancelled = f.bookings.TransitionBooking(cancel).booking();
  assert(cancelled.status() == v1::BOOKING_STATUS_CANCELLED);
  assert(cancelled.has_cancelled_at());
  assert(cancelled.cancellation_reason() == "plans changed");

  // The freed slot takes the overlapping request.
  assert(f.bookings.CreateBooking(f.Booking(14 * 60 + 30, 15 * 60 + 30)).booking().status() == v1::BOOKING_STATUS_PENDING);
}

void TestTransitionsAndHistory() {
  Fixture f;

  const auto created = f.bookings.CreateBooking(f.Booking(9 * 60, 10 * 60)).booking();

  v1::TransitionBookingRequest unspecified;
  unspecified.set_booking_id(created.id());
  unspecified.set_triggered_by("system");
  bool threw = false;
  try {
    (void)f.bookings.TransitionBooking(unspecified);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  for (auto target : {v1::BOOKING_STATUS_CONFIRMED, v1::BOOKING_STATUS_IN_PROGRESS, v1::BOOKING_STATUS_COMPLETED}) {
    v1::TransitionBookingRequest req;
    req.set_booking_id(created.id());
    req.set_target(target);
    req.set_triggered_by("provider-1");
    assert(f.bookings.TransitionBooking(req).booking().status() == target);
  }

  v1::ListTransitionsRequest history_req;
  history_req.set_booking_id(created.id());
  const auto history = f.bookings.ListTransitions(history_req);
  assert(history.transitions_size() == 4);
  assert(history.transitions(0).from_status() == v1::BOOKING_STATUS_UNSPECIFIED);
  assert(history.transitions(0).to_status() == v1::BOOKING_STATUS_PENDING);
  assert(history.transitions(3).to_status() == v1::BOOKING_STATUS_COMPLETED);

  v1::GetPayoutRequest payout_req;
  payout_req.set_booking_id(created.id());
  const auto payout = f.payouts.GetPayout(payout_req).payout();
  assert(payout.status() == v1::PAYOUT_STATUS_SCHEDULED);
  assert(payout.amount_cents() == 9'000);
  assert(payout.has_scheduled_at());
  assert(!payout.has_processed_at());

  v1::PayoutStatsRequest stats_req;
  stats_req.set_provider_id(kProvider);
  const auto stats = f.payouts.PayoutStats(stats_req);
  assert(stats.scheduled() == 1);
  assert(stats.pending_value_cents() == 9'000);
  assert(stats.has_oldest_pending_scheduled_at());
  assert(stats.oldest_pending_scheduled_at().seconds() == payout.scheduled_at().seconds());
  assert(stats.failure_rate() == 0.0);

  v1::CancelPayoutRequest cancel;
  cancel.set_payout_id(payout.id());
  cancel.set_performed_by("ops@example.com");
  assert(f.payouts.CancelPayout(cancel).payout().status() == v1::PAYOUT_STATUS_CANCELLED);

  v1::ListPayoutsRequest list;
  list.set_provider_id(kProvider);
  list.add_statuses(v1::PAYOUT_STATUS_CANCELLED);
  assert(f.payouts.ListPayouts(list).payouts_size() == 1);
}

void TestBlockAndUnblock() {
  Fixture f;

  v1::BlockSlotRequest block;
  block.set_provider_id(kProvider);
  block.set_date(kNextMon);
  block.set_full_day(true);
  block.set_reason("holiday");
  const auto blocked = f.schedule.BlockSlot(block);
  assert(blocked.blocks_size() == 1);

  for (const auto& slot : f.Slots(kNextMon).slots()) {
    assert(!slot.available());
  }

  v1::UnblockSlotRequest unblock;
  unblock.set_provider_id(kProvider);
  unblock.set_block_id(blocked.blocks(0).id());
  f.schedule.UnblockSlot(unblock);

  assert(SlotAvailable(f.Slots(kNextMon), 9 * 60));

  bool threw = false;
  try {
    f.schedule.UnblockSlot(unblock);
  } catch (const booking::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestScheduleValidation() {
  Fixture f;

  v1::UpsertProviderRequest far_offset;
  far_offset.mutable_provider()->set_id("provider-2");
  far_offset.mutable_provider()->set_utc_offset_minutes(15 * 60);
  bool threw = false;
  try {
    (void)f.schedule.UpsertProvider(far_offset);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  v1::SetWeeklyScheduleRequest bad_window;
  bad_window.set_provider_id(kProvider);
  auto* window = bad_window.add_windows();
  window->set_day_of_week(7);
  window->set_start_minute(9 * 60);
  window->set_end_minute(10 * 60);
  threw = false;
  try {
    (void)f.schedule.SetWeeklySchedule(bad_window);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLockBookAndReadBack();
  TestOverlapSurfacesConflict();
  TestTransitionsAndHistory();
  TestBlockAndUnblock();
  TestScheduleValidation();

  std::cout << "booking_engine_unit_booking_service: pass\n";
  return 0;
}
