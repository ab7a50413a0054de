#include "internal/core/booking_state_machine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/core/booking_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using booking::core::BookingCoordinator;
using booking::core::BookingOptions;
using booking::core::BookingStateMachine;
using booking::core::CreateBookingRequest;
using booking::model::BookingStatus;
using booking::model::PayoutStatus;

constexpr const char* kProvider = "provider-1";

struct Fixture {
  std::shared_ptr<booking::db::memory::MemoryRepository>      repository = std::make_shared<booking::db::memory::MemoryRepository>();
  std::shared_ptr<booking::availability::AvailabilityService> availability;
  std::shared_ptr<booking::payout::PayoutScheduler>           payouts;
  std::unique_ptr<BookingCoordinator>                         coordinator;
  std::unique_ptr<BookingStateMachine>                        machine;

  booking::util::Date      monday = booking::util::ParseDate("2030-01-07");
  booking::util::TimePoint now    = booking::util::LocalToInstant(booking::util::ParseDate("2030-01-01"), 0, 0);

  Fixture() {
    auto tx = repository->Begin();

    booking::db::model::ProviderRecord provider;
    provider.id   = kProvider;
    auto upserted = repository->UpsertProvider(*tx, provider);
    assert(upserted);

    booking::db::model::AvailabilityWindowRecord window;
    window.id           = "w-1";
    window.provider_id  = kProvider;
    window.day_of_week  = 1;
    window.start_minute = 9 * 60;
    window.end_minute   = 17 * 60;
    auto replaced       = repository->ReplaceAvailabilityWindows(*tx, kProvider, {window});
    assert(replaced);
    tx->Commit();

    availability = std::make_shared<booking::availability::AvailabilityService>(repository, booking::availability::AvailabilityOptions{});
    payouts      = std::make_shared<booking::payout::PayoutScheduler>(repository, nullptr, nullptr, nullptr, booking::payout::PayoutOptions{});

    BookingOptions options;
    options.late_cancel_window      = 24h;
    options.late_cancel_fee_percent = 25;
    coordinator = std::make_unique<BookingCoordinator>(repository, availability, nullptr, booking::core::FeePolicy(booking::core::FeeOptions{}),
                                                       nullptr, options);
    machine     = std::make_unique<BookingStateMachine>(repository, availability, payouts, nullptr, options);
  }

  booking::db::model::BookingRecord Book(uint32_t start, uint32_t end) {
    CreateBookingRequest request;
    request.provider_id      = kProvider;
    request.customer_id      = "customer-1";
    request.date             = monday;
    request.start_minute     = start;
    request.end_minute       = end;
    request.base_price_cents = 10'000;
    return coordinator->CreateBooking(request, now);
  }
};

void TestPendingCancellationWritesOneTransition() {
  Fixture f;

  const auto booking = f.Book(14 * 60, 15 * 60);
  const auto before  = f.machine->History(booking.id).size();

  const auto cancelled = f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "changed plans", f.now + 1h);
  assert(cancelled.status == BookingStatus::kCancelled);
  assert(cancelled.version == booking.version + 1);
  assert(cancelled.cancelled_by == "customer-1");
  assert(cancelled.cancellation_reason == "changed plans");
  assert(cancelled.cancellation_fee_cents == 0);

  const auto history = f.machine->History(booking.id);
  assert(history.size() == before + 1);
  assert(history.back().from_status == BookingStatus::kPending);
  assert(history.back().to_status == BookingStatus::kCancelled);
  assert(f.machine->Ledger(booking.id).empty());
}

void TestCompletedBookingCannotBeCancelled() {
  Fixture f;

  const auto booking = f.Book(9 * 60, 10 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kConfirmed, "system", "", f.now);
  (void)f.machine->Transition(booking.id, BookingStatus::kInProgress, "provider-1", "", f.now);
  const auto completed   = f.machine->Transition(booking.id, BookingStatus::kCompleted, "provider-1", "", f.now);
  const auto transitions = f.machine->History(booking.id).size();

  bool rejected = false;
  try {
    (void)f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "", f.now);
  } catch (const booking::util::InvalidTransitionError& e) {
    rejected = true;
    assert(e.Current() == BookingStatus::kCompleted);
    assert(e.Requested() == BookingStatus::kCancelled);
  }
  assert(rejected);

  auto stored = f.coordinator->GetBooking(booking.id);
  assert(stored->status == BookingStatus::kCompleted);
  assert(stored->version == completed.version);
  assert(f.machine->History(booking.id).size() == transitions);
}

void TestCompletionSchedulesEscrowedPayout() {
  Fixture f;

  const auto booking = f.Book(9 * 60, 10 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kConfirmed, "system", "", f.now);
  (void)f.machine->Transition(booking.id, BookingStatus::kInProgress, "provider-1", "", f.now);
  (void)f.machine->Transition(booking.id, BookingStatus::kCompleted, "provider-1", "", f.now);

  auto payout = f.payouts->GetByBooking(booking.id);
  assert(payout.has_value());
  assert(payout->status == PayoutStatus::kScheduled);
  assert(payout->amount_cents == booking.provider_payout_cents);
  assert(payout->provider_id == kProvider);
  assert(payout->scheduled_at_ms == booking::util::ToUnixMillis(f.now + std::chrono::days(7)));
}

void TestLateCancellationOfConfirmedBookingChargesFee() {
  Fixture f;

  const auto booking = f.Book(14 * 60, 15 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kConfirmed, "system", "", f.now);

  // 10 hours before the 14:00 start.
  const auto late      = booking::util::LocalToInstant(f.monday, 4 * 60, 0);
  const auto cancelled = f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "", late);
  assert(cancelled.cancellation_fee_cents == 2'500);

  const auto ledger = f.machine->Ledger(booking.id);
  assert(ledger.size() == 1);
  assert(ledger[0].kind == "cancellation_fee");
  assert(ledger[0].amount_cents == 2'500);
}

void TestEarlyCancellationIsFree() {
  Fixture f;

  const auto booking = f.Book(14 * 60, 15 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kConfirmed, "system", "", f.now);

  // 48 hours before the start.
  const auto early     = booking::util::LocalToInstant(f.monday, 14 * 60, 0) - 48h;
  const auto cancelled = f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "", early);
  assert(cancelled.cancellation_fee_cents == 0);
  assert(f.machine->Ledger(booking.id).empty());
}

void TestCancellationFreesTheSlot() {
  Fixture f;

  const auto booking = f.Book(11 * 60, 12 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "", f.now);

  const auto rebooked = f.Book(11 * 60, 12 * 60);
  assert(rebooked.id != booking.id);
}

void TestRefundedIsTerminal() {
  Fixture f;

  const auto booking = f.Book(12 * 60, 13 * 60);
  (void)f.machine->Transition(booking.id, BookingStatus::kCancelled, "customer-1", "", f.now);
  (void)f.machine->Transition(booking.id, BookingStatus::kRefunded, "support", "", f.now);

  bool rejected = false;
  try {
    (void)f.machine->Transition(booking.id, BookingStatus::kPending, "support", "", f.now);
  } catch (const booking::util::InvalidTransitionError&) {
    rejected = true;
  }
  assert(rejected);
}

void TestMissingActorAndBookingAreRejected() {
  Fixture f;

  const auto booking = f.Book(9 * 60, 10 * 60);

  bool threw = false;
  try {
    (void)f.machine->Transition(booking.id, BookingStatus::kConfirmed, "", "", f.now);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.machine->Transition("booking-missing", BookingStatus::kConfirmed, "system", "", f.now);
  } catch (const booking::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPendingCancellationWritesOneTransition();
  TestCompletedBookingCannotBeCancelled();
  TestCompletionSchedulesEscrowedPayout();
  TestLateCancellationOfConfirmedBookingChargesFee();
  TestEarlyCancellationIsFree();
  TestCancellationFreesTheSlot();
  TestRefundedIsTerminal();
  TestMissingActorAndBookingAreRejected();

  std::cout << "booking_engine_unit_booking_state_machine: pass\n";
  return 0;
}
