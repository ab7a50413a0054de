#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

using booking::db::ErrorCode;
using booking::db::Repository;
using booking::db::memory::MemoryRepository;
using booking::db::model::AvailabilityCacheRecord;
using booking::db::model::AvailabilityWindowRecord;
using booking::db::model::BlockedSlotRecord;
using booking::db::model::BookingRecord;
using booking::db::model::LedgerEntryRecord;
using booking::db::model::PayoutRecord;
using booking::db::model::ProviderRecord;
using booking::db::model::SlotLockRecord;
using booking::db::model::TransitionRecord;
using booking::model::BookingStatus;
using booking::model::PayoutStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Postgres keeps rows between runs, so every id carries a run suffix.
const std::string kRun = std::to_string(NowMs());

BookingRecord MakeBooking(const std::string& id, const std::string& provider_id, const std::string& date, uint32_t start, uint32_t end) {
  BookingRecord booking;
  booking.id                    = id;
  booking.provider_id           = provider_id;
  booking.customer_id           = "customer-1";
  booking.date                  = date;
  booking.start_minute          = start;
  booking.end_minute            = end;
  booking.status                = BookingStatus::kPending;
  booking.total_cents           = 10'000;
  booking.platform_fee_cents    = 1'000;
  booking.provider_payout_cents = 9'000;
  booking.currency              = "USD";
  booking.confirmation_code     = "C" + id;
  booking.created_at_ms         = NowMs();
  booking.updated_at_ms         = booking.created_at_ms;
  booking.version               = 1;
  return booking;
}

void SeedProvider(Repository& repo, const std::string& provider_id) {
  auto tx = repo.Begin();

  ProviderRecord provider;
  provider.id                 = provider_id;
  provider.display_name       = "Provider " + provider_id;
  provider.utc_offset_minutes = 60;
  provider.created_at_ms      = NowMs();
  provider.updated_at_ms      = provider.created_at_ms;
  auto upserted               = repo.UpsertProvider(*tx, provider);
  assert(upserted);

  tx->Commit();
}

void VerifyProviderSchedule(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);

  {
    auto tx = repo.Begin();

    auto provider = repo.GetProvider(*tx, provider_id);
    assert(provider.has_value());
    assert(provider->utc_offset_minutes == 60);

    AvailabilityWindowRecord morning{.id = provider_id + "-w1", .provider_id = provider_id, .day_of_week = 1, .start_minute = 540, .end_minute = 720};
    auto first = repo.ReplaceAvailabilityWindows(*tx, provider_id, {morning});
    assert(first);

    AvailabilityWindowRecord afternoon{
        .id = provider_id + "-w2", .provider_id = provider_id, .day_of_week = 1, .start_minute = 780, .end_minute = 1020};
    AvailabilityWindowRecord friday{.id = provider_id + "-w3", .provider_id = provider_id, .day_of_week = 5, .start_minute = 600, .end_minute = 660};
    auto second = repo.ReplaceAvailabilityWindows(*tx, provider_id, {afternoon, friday});
    assert(second);

    std::size_t active = 0;
    for (const auto& window : repo.ListAvailabilityWindows(*tx, provider_id)) {
      if (window.active) {
        ++active;
        assert(window.id != morning.id);
      }
    }
    assert(active == 2);

    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    BlockedSlotRecord holiday{.id = provider_id + "-b1", .provider_id = provider_id, .date = "2030-01-07", .full_day = true, .reason = "holiday"};
    BlockedSlotRecord dentist{.id           = provider_id + "-b2",
                              .provider_id  = provider_id,
                              .date         = "2030-01-09",
                              .full_day     = false,
                              .start_minute = 600,
                              .end_minute   = 660};
    auto holiday_inserted = repo.InsertBlockedSlot(*tx, holiday);
    auto dentist_inserted = repo.InsertBlockedSlot(*tx, dentist);
    assert(holiday_inserted && dentist_inserted);

    const auto in_range = repo.ListBlockedSlots(*tx, provider_id, {"2030-01-07", "2030-01-08"});
    assert(in_range.size() == 1);
    assert(in_range[0].full_day);

    auto deleted = repo.DeleteBlockedSlot(*tx, provider_id, holiday.id);
    assert(deleted);
    auto deleted_again = repo.DeleteBlockedSlot(*tx, provider_id, holiday.id);
    assert(deleted_again.code == ErrorCode::NotFound);

    const auto remaining = repo.ListBlockedSlots(*tx, provider_id, {"2030-01-01", "2030-01-31"});
    assert(remaining.size() == 1);
    assert(remaining[0].start_minute == 600);

    tx->Commit();
  }
}

void VerifyBookingLifecycle(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);
  const std::string date = "2030-01-07";

  auto first = MakeBooking(provider_id + "-bk1", provider_id, date, 840, 900);
  {
    auto tx     = repo.Begin();
    auto locked = repo.LockProviderDate(*tx, provider_id, date);
    assert(locked);
    auto inserted = repo.InsertBooking(*tx, first);
    assert(inserted);

    TransitionRecord created{.id = first.id + "-t0", .booking_id = first.id, .to_status = BookingStatus::kPending, .triggered_by = "customer-1"};
    created.created_at_ms = NowMs();
    auto audited          = repo.InsertTransition(*tx, created);
    assert(audited);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    auto overlap = MakeBooking(provider_id + "-bk2", provider_id, date, 870, 930);
    auto clash   = repo.InsertBooking(*tx, overlap);
    assert(clash.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();

    auto adjacent = MakeBooking(provider_id + "-bk3", provider_id, date, 900, 960);
    auto inserted = repo.InsertBooking(*tx, adjacent);
    assert(inserted);

    const auto occupying = repo.ListOccupyingBookings(*tx, provider_id, {date, date});
    assert(occupying.size() == 2);
    assert(occupying[0].id == first.id);
    assert(occupying[1].start_minute == 900);

    auto by_code = repo.GetBookingByConfirmationCode(*tx, first.confirmation_code);
    assert(by_code.has_value());
    assert(by_code->id == first.id);
    assert(by_code->guest_email.empty());
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    auto stored = repo.GetBooking(*tx, first.id);
    assert(stored.has_value());

    auto cancelled                   = *stored;
    cancelled.status                 = BookingStatus::kCancelled;
    cancelled.cancelled_at_ms        = NowMs();
    cancelled.cancelled_by           = "customer-1";
    cancelled.cancellation_reason    = "changed plans";
    cancelled.cancellation_fee_cents = 2'500;
    cancelled.version                = stored->version + 1;

    auto stale = repo.UpdateBooking(*tx, cancelled, stored->version + 5);
    assert(stale.code == ErrorCode::Conflict);

    auto updated = repo.UpdateBooking(*tx, cancelled, stored->version);
    assert(updated);

    TransitionRecord transition{.id           = first.id + "-t1",
                                .booking_id   = first.id,
                                .from_status  = BookingStatus::kPending,
                                .to_status    = BookingStatus::kCancelled,
                                .triggered_by = "customer-1",
                                .reason       = "changed plans"};
    transition.created_at_ms = NowMs() + 1;
    auto audited             = repo.InsertTransition(*tx, transition);
    assert(audited);

    LedgerEntryRecord fee{.id = first.id + "-l1", .booking_id = first.id, .kind = "cancellation_fee", .amount_cents = 2'500, .currency = "USD"};
    fee.created_at_ms = NowMs();
    auto charged      = repo.InsertLedgerEntry(*tx, fee);
    assert(charged);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    auto stored = repo.GetBooking(*tx, first.id);
    assert(stored->status == BookingStatus::kCancelled);
    assert(stored->cancelled_by == "customer-1");
    assert(stored->cancellation_fee_cents == 2'500);

    const auto history = repo.ListTransitions(*tx, first.id);
    assert(history.size() == 2);
    assert(!history[0].from_status.has_value());
    assert(history[1].from_status == BookingStatus::kPending);
    assert(history[1].to_status == BookingStatus::kCancelled);

    const auto ledger = repo.ListLedgerEntries(*tx, first.id);
    assert(ledger.size() == 1);
    assert(ledger[0].amount_cents == 2'500);

    // The cancelled booking no longer holds its slot.
    assert(repo.ListOccupyingBookings(*tx, provider_id, {date, date}).size() == 1);
    auto rebooked = repo.InsertBooking(*tx, MakeBooking(provider_id + "-bk4", provider_id, date, 840, 900));
    assert(rebooked);
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);

  const auto booking = MakeBooking(provider_id + "-rb", provider_id, "2030-01-08", 600, 660);
  {
    auto tx       = repo.Begin();
    auto inserted = repo.InsertBooking(*tx, booking);
    assert(inserted);
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetBooking(*check_tx, booking.id).has_value());
  check_tx->Commit();
}

void VerifySlotLocks(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);
  const auto now = NowMs();

  SlotLockRecord live{.lock_id         = provider_id + "-lk1",
                      .provider_id     = provider_id,
                      .date            = "2030-01-07",
                      .start_minute    = 600,
                      .end_minute      = 660,
                      .session_id      = "session-a",
                      .locked_until_ms = now + 600'000,
                      .created_at_ms   = now};
  SlotLockRecord stale  = live;
  stale.lock_id         = provider_id + "-lk2";
  stale.start_minute    = 720;
  stale.end_minute      = 780;
  stale.session_id      = "session-b";
  stale.locked_until_ms = now - 1;

  {
    auto tx     = repo.Begin();
    auto first  = repo.UpsertSlotLock(*tx, live);
    auto second = repo.UpsertSlotLock(*tx, stale);
    assert(first && second);

    live.locked_until_ms = now + 1'200'000;
    auto extended        = repo.UpsertSlotLock(*tx, live);
    assert(extended);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    auto read = repo.GetSlotLock(*tx, live.lock_id);
    assert(read.has_value());
    assert(read->locked_until_ms == now + 1'200'000);
    assert(repo.ListSlotLocks(*tx, provider_id, "2030-01-07").size() == 2);

    uint64_t deleted = 0;
    auto     swept   = repo.DeleteExpiredSlotLocks(*tx, now, deleted);
    assert(swept);
    assert(deleted >= 1);
    assert(!repo.GetSlotLock(*tx, stale.lock_id).has_value());

    auto released = repo.DeleteSlotLock(*tx, live.lock_id);
    assert(released);
    assert(repo.ListSlotLocks(*tx, provider_id, "2030-01-07").empty());
    tx->Commit();
  }
}

void VerifyAvailabilityCache(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);
  const auto        now  = NowMs();
  const std::string date = "2030-01-07";

  std::vector<AvailabilityCacheRecord> slots;
  for (uint32_t start = 540; start < 720; start += 60) {
    slots.push_back(AvailabilityCacheRecord{
        .provider_id = provider_id, .date = date, .start_minute = start, .end_minute = start + 60, .available = start != 600, .expires_at_ms = now + 60'000});
  }

  auto tx       = repo.Begin();
  auto replaced = repo.ReplaceCachedSlots(*tx, provider_id, date, 60, slots);
  assert(replaced);

  auto cached = repo.GetCachedSlots(*tx, provider_id, date, 60, now);
  assert(cached.size() == 3);
  assert(!cached[1].available);
  assert(repo.GetCachedSlots(*tx, provider_id, date, 30, now).empty());
  assert(repo.GetCachedSlots(*tx, provider_id, date, 60, now + 120'000).empty());

  auto invalidated = repo.InvalidateCachedSlots(*tx, provider_id, date);
  assert(invalidated);
  assert(repo.GetCachedSlots(*tx, provider_id, date, 60, now).empty());

  auto refilled = repo.ReplaceCachedSlots(*tx, provider_id, date, 60, slots);
  assert(refilled);
  uint64_t deleted = 0;
  auto     swept   = repo.DeleteExpiredCachedSlots(*tx, now + 120'000, deleted);
  assert(swept);
  assert(deleted >= 3);
  tx->Commit();
}

void VerifyPayouts(Repository& repo, const std::string& provider_id) {
  SeedProvider(repo, provider_id);
  const auto now = NowMs();

  auto first  = MakeBooking(provider_id + "-pb1", provider_id, "2030-01-07", 540, 600);
  auto second = MakeBooking(provider_id + "-pb2", provider_id, "2030-01-07", 600, 660);
  first.status = second.status = BookingStatus::kCompleted;

  PayoutRecord due{.id              = provider_id + "-po1",
                   .booking_id      = first.id,
                   .provider_id     = provider_id,
                   .amount_cents    = 9'000,
                   .currency        = "USD",
                   .status          = PayoutStatus::kScheduled,
                   .scheduled_at_ms = now - 1'000,
                   .created_at_ms   = now,
                   .updated_at_ms   = now};
  PayoutRecord later    = due;
  later.id              = provider_id + "-po2";
  later.booking_id      = second.id;
  later.scheduled_at_ms = now + 86'400'000;

  {
    auto tx = repo.Begin();
    auto b1 = repo.InsertBooking(*tx, first);
    auto b2 = repo.InsertBooking(*tx, second);
    assert(b1 && b2);

    auto p1 = repo.InsertPayout(*tx, due);
    auto p2 = repo.InsertPayout(*tx, later);
    assert(p1 && p2);

    auto duplicate = due;
    duplicate.id   = provider_id + "-po3";
    auto rejected  = repo.InsertPayout(*tx, duplicate);
    assert(rejected.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    auto b1 = repo.InsertBooking(*tx, first);
    auto b2 = repo.InsertBooking(*tx, second);
    auto p1 = repo.InsertPayout(*tx, due);
    auto p2 = repo.InsertPayout(*tx, later);
    assert(b1 && b2 && p1 && p2);
    tx->Commit();
  }

  {
    auto        tx      = repo.Begin();
    auto        claimed = repo.ClaimDuePayouts(*tx, now, 10);
    std::size_t ours    = 0;
    for (const auto& payout : claimed) {
      if (payout.provider_id == provider_id) {
        ++ours;
        assert(payout.id == due.id);
        assert(payout.status == PayoutStatus::kProcessing);
      }
    }
    assert(ours == 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    for (const auto& payout : repo.ClaimDuePayouts(*tx, now, 10)) {
      assert(payout.provider_id != provider_id);
    }

    auto processing = repo.GetPayout(*tx, due.id);
    assert(processing.has_value());
    processing->status               = PayoutStatus::kCompleted;
    processing->external_transfer_id = "tr-1";
    processing->processed_at_ms      = now;
    auto updated                     = repo.UpdatePayout(*tx, *processing);
    assert(updated);

    auto by_booking = repo.GetPayoutByBooking(*tx, second.id);
    assert(by_booking.has_value());
    assert(by_booking->id == later.id);

    booking::db::PayoutFilter filter;
    filter.provider_id = provider_id;
    assert(repo.ListPayouts(*tx, filter).size() == 2);

    filter.statuses = {PayoutStatus::kCompleted};
    const auto completed = repo.ListPayouts(*tx, filter);
    assert(completed.size() == 1);
    assert(completed[0].external_transfer_id == "tr-1");

    filter.statuses   = {};
    filter.page.limit = 1;
    assert(repo.ListPayouts(*tx, filter).size() == 1);
    tx->Commit();
  }
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& provider_id, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }
  SeedProvider(repo, provider_id);

  const auto seed = MakeBooking(provider_id + "-cc", provider_id, "2030-01-10", 600, 660);
  {
    auto tx       = repo.Begin();
    auto inserted = repo.InsertBooking(*tx, seed);
    assert(inserted);
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetBooking(*tx1, seed.id);
  auto r2 = repo.GetBooking(*tx2, seed.id);
  assert(r1.has_value() && r2.has_value());

  r1->status  = BookingStatus::kConfirmed;
  r1->version = 2;
  r2->status  = BookingStatus::kCancelled;
  r2->version = 2;

  auto first = repo.UpdateBooking(*tx1, *r1, 1);
  assert(first);
  tx1->Commit();

  auto second = repo.UpdateBooking(*tx2, *r2, 1);
  assert(second);
  bool lost = false;
  try {
    tx2->Commit();
  } catch (const booking::db::CommitConflict&) {
    lost = true;
  }
  assert(lost);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetBooking(*verify_tx, seed.id);
  assert(final.has_value());
  assert(final->status == BookingStatus::kConfirmed);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& provider_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  SeedProvider(*repo, provider_id);

  const auto booking = MakeBooking(provider_id + "-dur", provider_id, "2030-01-11", 600, 660);
  {
    auto tx       = repo->Begin();
    auto inserted = repo->InsertBooking(*tx, booking);
    assert(inserted);

    PayoutRecord payout{.id              = provider_id + "-dur-po",
                        .booking_id      = booking.id,
                        .provider_id     = provider_id,
                        .amount_cents    = 9'000,
                        .currency        = "USD",
                        .scheduled_at_ms = NowMs() + 604'800'000};
    auto scheduled = repo->InsertPayout(*tx, payout);
    assert(scheduled);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto stored = repo->GetBooking(*tx, booking.id);
  assert(stored.has_value());
  assert(stored->total_cents == 10'000);
  assert(stored->confirmation_code == booking.confirmation_code);

  auto payout = repo->GetPayoutByBooking(*tx, booking.id);
  assert(payout.has_value());
  assert(payout->status == PayoutStatus::kScheduled);
  assert(repo->GetProvider(*tx, provider_id).has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if BOOKING_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("booking_engine_integration_sqlite_" + kRun + ".db")).string();

  auto make_repo = [db_path]() {
    booking::runtime::config::DatabaseConfig database;
    database.mutable_sqlite()->set_path(db_path);
    database.mutable_sqlite()->set_wal_mode(true);
    return booking::factory::BuildRepository(database);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo.reset(); repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      // One shared connection; a second Begin() waits for the first transaction.
      .supports_parallel_transactions = false,
  };
}
#endif

#if BOOKING_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("BOOKING_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("BOOKING_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    booking::runtime::config::DatabaseConfig database;
    database.mutable_postgres()->set_connection_uri(conninfo);
    database.mutable_postgres()->set_max_connections(4);
    return booking::factory::BuildRepository(database);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + "-" + kRun;
  {
    auto repo = backend.make_repository();

    VerifyProviderSchedule(*repo, prefix + "-schedule");
    VerifyBookingLifecycle(*repo, prefix + "-bookings");
    VerifyRollbackBehavior(*repo, prefix + "-rollback");
    VerifySlotLocks(*repo, prefix + "-locks");
    VerifyAvailabilityCache(*repo, prefix + "-cache");
    VerifyPayouts(*repo, prefix + "-payouts");
    VerifyConcurrentUpdates(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if BOOKING_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if BOOKING_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "booking_engine_integration_repository_parity: pass\n";
  return 0;
}
