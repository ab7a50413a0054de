#include "internal/lock/slot_lock_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using booking::availability::AvailabilityOptions;
using booking::availability::AvailabilityService;
using booking::lock::SlotLockManager;
using booking::lock::SlotLockOptions;

constexpr const char* kProvider = "provider-1";

struct Fixture {
  std::shared_ptr<booking::db::memory::MemoryRepository> repository = std::make_shared<booking::db::memory::MemoryRepository>();
  std::shared_ptr<AvailabilityService>                   availability;
  std::unique_ptr<SlotLockManager>                       locks;

  booking::util::Date      monday = booking::util::ParseDate("2030-01-07");
  booking::util::TimePoint now    = booking::util::LocalToInstant(booking::util::ParseDate("2030-01-01"), 0, 0);

  Fixture() {
    auto tx = repository->Begin();

    booking::db::model::ProviderRecord provider;
    provider.id           = kProvider;
    provider.display_name = "Test Provider";
    auto upserted = repository->UpsertProvider(*tx, provider);
    assert(upserted);

    booking::db::model::AvailabilityWindowRecord window;
    window.id           = "w-1";
    window.provider_id  = kProvider;
    window.day_of_week  = 1;
    window.start_minute = 9 * 60;
    window.end_minute   = 17 * 60;
    auto replaced = repository->ReplaceAvailabilityWindows(*tx, kProvider, {window});
    assert(replaced);
    tx->Commit();

    AvailabilityOptions options;
    options.slot_granularity_minutes = 60;
    availability = std::make_shared<AvailabilityService>(repository, options);

    SlotLockOptions lock_options;
    lock_options.default_ttl = 10min;
    lock_options.max_ttl     = 30min;
    locks                    = std::make_unique<SlotLockManager>(repository, availability, lock_options);
  }
};

void TestSecondSessionIsContestedUntilExpiry() {
  Fixture f;

  auto first = f.locks->Acquire(kProvider, f.monday, 10 * 60, 11 * 60, "session-a", std::nullopt, f.now);
  assert(first.acquired);
  assert(first.lock.has_value());
  assert(first.lock->locked_until_ms == booking::util::ToUnixMillis(f.now + 10min));

  auto second = f.locks->Acquire(kProvider, f.monday, 10 * 60, 11 * 60, "session-b", std::nullopt, f.now + 1min);
  assert(!second.acquired);
  assert(!second.reason.empty());
  assert(!second.alternatives.empty());
  for (const auto& slot : second.alternatives) {
    assert(slot.available);
    if (slot.date == f.monday) {
      assert(!booking::model::Overlaps(slot.start_minute, slot.end_minute, 10 * 60, 11 * 60));
    }
  }

  auto after_expiry = f.locks->Acquire(kProvider, f.monday, 10 * 60, 11 * 60, "session-b", std::nullopt, f.now + 11min);
  assert(after_expiry.acquired);
  assert(after_expiry.lock->session_id == "session-b");
}

void TestSameSessionExtendsItsLock() {
  Fixture f;

  auto first = f.locks->Acquire(kProvider, f.monday, 9 * 60, 10 * 60, "session-a", 5min, f.now);
  assert(first.acquired);

  auto again = f.locks->Acquire(kProvider, f.monday, 9 * 60, 10 * 60, "session-a", 5min, f.now + 2min);
  assert(again.acquired);
  assert(again.lock->lock_id == first.lock->lock_id);
  assert(again.lock->locked_until_ms == booking::util::ToUnixMillis(f.now + 7min));
}

void TestOffGridIntervalIsNotOffered() {
  Fixture f;

  auto result = f.locks->Acquire(kProvider, f.monday, 9 * 60 + 30, 10 * 60 + 30, "session-a", std::nullopt, f.now);
  assert(!result.acquired);
}

void TestTtlAboveMaximumIsRejected() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.locks->Acquire(kProvider, f.monday, 9 * 60, 10 * 60, "session-a", 31min, f.now);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestReleaseIsIdempotent() {
  Fixture f;

  auto held = f.locks->Acquire(kProvider, f.monday, 11 * 60, 12 * 60, "session-a", std::nullopt, f.now);
  assert(held.acquired);

  const bool released      = f.locks->Release(held.lock->lock_id);
  const bool released_again = f.locks->Release(held.lock->lock_id);
  assert(released);
  assert(!released_again);
  assert(!f.locks->Get(held.lock->lock_id).has_value());

  auto other = f.locks->Acquire(kProvider, f.monday, 11 * 60, 12 * 60, "session-b", std::nullopt, f.now + 1s);
  assert(other.acquired);
}

void TestSweepDropsExpiredLocks() {
  Fixture f;

  auto held = f.locks->Acquire(kProvider, f.monday, 13 * 60, 14 * 60, "session-a", 1min, f.now);
  assert(held.acquired);

  auto early = f.locks->Sweep(f.now + 30s);
  assert(early.locks_deleted == 0);
  assert(f.locks->Get(held.lock->lock_id).has_value());

  auto late = f.locks->Sweep(f.now + 2min);
  assert(late.locks_deleted == 1);
  assert(!f.locks->Get(held.lock->lock_id).has_value());
}

} // namespace

int main() {
  TestSecondSessionIsContestedUntilExpiry();
  TestSameSessionExtendsItsLock();
  TestOffGridIntervalIsNotOffered();
  TestTtlAboveMaximumIsRejected();
  TestReleaseIsIdempotent();
  TestSweepDropsExpiredLocks();

  std::cout << "booking_engine_unit_slot_lock_manager: pass\n";
  return 0;
}
