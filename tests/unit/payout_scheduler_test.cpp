#include "internal/payout/payout_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using booking::model::PayoutStatus;
using booking::payout::PaymentProvider;
using booking::payout::PayoutOptions;
using booking::payout::PayoutScheduler;
using booking::payout::TransferRequest;
using booking::payout::TransferResult;

enum class Behavior { kSucceed, kTransient, kPermanent };

class FakeProvider final : public PaymentProvider {
 public:
  explicit FakeProvider(Behavior behavior, std::chrono::milliseconds delay = 0ms) : behavior_(behavior), delay_(delay) {
  }

  TransferResult Transfer(const TransferRequest& request) override {
    {
      std::scoped_lock lock(mutex_);
      keys_.push_back(request.idempotency_key);
    }
    calls_.fetch_add(1);
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    switch (behavior_) {
      case Behavior::kTransient:
        throw booking::util::TransientProviderError("gateway unavailable");
      case Behavior::kPermanent:
        throw booking::util::PermanentProviderError("account closed");
      case Behavior::kSucceed:
        break;
    }
    return TransferResult{"tr-" + request.payout_id};
  }

  int Calls() const {
    return calls_.load();
  }

  std::vector<std::string> Keys() {
    std::scoped_lock lock(mutex_);
    return keys_;
  }

 private:
  Behavior                  behavior_;
  std::chrono::milliseconds delay_;
  std::atomic<int>          calls_{0};
  std::mutex                mutex_;
  std::vector<std::string>  keys_;
};

class CountingSink final : public booking::events::EventSink {
 public:
  void Publish(const booking::events::Event&) override {
    published.fetch_add(1);
  }
  void Alert(const booking::events::Event&) override {
    alerts.fetch_add(1);
  }

  std::atomic<int> published{0};
  std::atomic<int> alerts{0};
};

const booking::util::TimePoint kCompletedAt = booking::util::LocalToInstant(booking::util::ParseDate("2030-01-07"), 10 * 60, 0);

booking::db::model::BookingRecord CompletedBooking(const std::string& id) {
  booking::db::model::BookingRecord booking;
  booking.id                    = id;
  booking.provider_id           = "provider-1";
  booking.date                  = "2030-01-07";
  booking.start_minute          = 9 * 60;
  booking.end_minute            = 10 * 60;
  booking.status                = booking::model::BookingStatus::kCompleted;
  booking.total_cents           = 10'000;
  booking.platform_fee_cents    = 1'000;
  booking.provider_payout_cents = 9'000;
  booking.currency              = "USD";
  return booking;
}

std::unique_ptr<PayoutScheduler> MakeScheduler(std::shared_ptr<booking::db::Repository> repository, std::shared_ptr<PaymentProvider> provider,
                                               std::shared_ptr<booking::events::EventSink> events = nullptr) {
  PayoutOptions options;
  options.escrow_days = 7;
  return std::make_unique<PayoutScheduler>(std::move(repository), std::move(provider), std::make_shared<booking::payout::ScheduleRetryPolicy>(),
                                           std::move(events), options);
}

void TestPayoutIsHeldForEscrow() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto provider   = std::make_shared<FakeProvider>(Behavior::kSucceed);
  auto scheduler  = MakeScheduler(repository, provider);

  const auto payout = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  assert(payout.status == PayoutStatus::kScheduled);
  assert(payout.amount_cents == 9'000);
  assert(payout.scheduled_at_ms == booking::util::ToUnixMillis(kCompletedAt + std::chrono::days(7)));

  auto early = scheduler->ProcessDue(kCompletedAt + std::chrono::days(6));
  assert(early.claimed == 0);
  assert(provider->Calls() == 0);

  auto due = scheduler->ProcessDue(kCompletedAt + std::chrono::days(7));
  assert(due.claimed == 1);
  assert(due.completed == 1);

  auto stored = scheduler->Get(payout.id);
  assert(stored->status == PayoutStatus::kCompleted);
  assert(stored->external_transfer_id == "tr-" + payout.id);
  assert(stored->processed_at_ms == booking::util::ToUnixMillis(kCompletedAt + std::chrono::days(7)));
  assert(provider->Keys().front() == PayoutScheduler::IdempotencyKey(payout.id));
}

void TestSecondPayoutForBookingIsRejected() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto scheduler  = MakeScheduler(repository, nullptr);

  (void)scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);

  bool threw = false;
  try {
    (void)scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  } catch (const booking::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestTransientFailuresBackOffThenFail() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto provider   = std::make_shared<FakeProvider>(Behavior::kTransient);
  auto events     = std::make_shared<CountingSink>();
  auto scheduler  = MakeScheduler(repository, provider, events);

  const auto payout = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  auto       at     = booking::util::FromUnixMillis(payout.scheduled_at_ms);

  // Default schedule: 1h, 6h, 24h with three retries.
  const std::chrono::hours backoff[] = {1h, 6h, 24h};
  for (uint32_t attempt = 1; attempt <= 3; ++attempt) {
    auto stats = scheduler->ProcessDue(at);
    assert(stats.claimed == 1);
    assert(stats.retried == 1);

    auto stored = scheduler->Get(payout.id);
    assert(stored->status == PayoutStatus::kScheduled);
    assert(stored->retry_count == attempt);
    assert(stored->failure_reason == "gateway unavailable");
    assert(stored->scheduled_at_ms == booking::util::ToUnixMillis(at + backoff[attempt - 1]));

    // Not picked up again before the backoff elapses.
    assert(scheduler->ProcessDue(at + backoff[attempt - 1] - 1min).claimed == 0);
    at += backoff[attempt - 1];
  }

  auto last = scheduler->ProcessDue(at);
  assert(last.failed == 1);

  auto stored = scheduler->Get(payout.id);
  assert(stored->status == PayoutStatus::kFailed);
  assert(stored->retry_count == 4);
  assert(provider->Calls() == 4);
  assert(events->alerts.load() == 1);

  for (const auto& key : provider->Keys()) {
    assert(key == PayoutScheduler::IdempotencyKey(payout.id));
  }
}

void TestPermanentFailureIsTerminal() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto provider   = std::make_shared<FakeProvider>(Behavior::kPermanent);
  auto scheduler  = MakeScheduler(repository, provider);

  const auto payout = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  auto       stats  = scheduler->ProcessDue(kCompletedAt + std::chrono::days(8));
  assert(stats.failed == 1);

  auto stored = scheduler->Get(payout.id);
  assert(stored->status == PayoutStatus::kFailed);
  assert(stored->retry_count == 0);
  assert(stored->failure_reason == "account closed");
}

void TestMissingProviderKeepsPayoutScheduled() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto events     = std::make_shared<CountingSink>();
  auto scheduler  = MakeScheduler(repository, nullptr, events);

  const auto payout = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);

  // Passes over several days never claim, retry or fail it.
  for (int day = 8; day <= 14; ++day) {
    auto stats = scheduler->ProcessDue(kCompletedAt + std::chrono::days(day));
    assert(stats.claimed == 0);
    assert(stats.retried == 0);
    assert(stats.failed == 0);
  }

  auto stored = scheduler->Get(payout.id);
  assert(stored->status == PayoutStatus::kScheduled);
  assert(stored->retry_count == 0);
  assert(stored->scheduled_at_ms == payout.scheduled_at_ms);
  assert(stored->failure_reason.empty());
  assert(events->alerts.load() == 0);

  // A scheduler that does have a provider picks it up at once.
  auto provider = std::make_shared<FakeProvider>(Behavior::kSucceed);
  auto settled  = MakeScheduler(repository, provider);
  assert(settled->ProcessDue(kCompletedAt + std::chrono::days(15)).completed == 1);
  assert(settled->Get(payout.id)->status == PayoutStatus::kCompleted);
}

void TestConcurrentPassesTransferOnce() {
  constexpr int kPasses = 4;

  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto provider   = std::make_shared<FakeProvider>(Behavior::kSucceed, 20ms);
  auto scheduler  = MakeScheduler(repository, provider);

  const auto payout = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  const auto due    = kCompletedAt + std::chrono::days(7);

  std::atomic<int>         completed{0};
  std::atomic<int>         errors{0};
  std::vector<std::thread> passes;
  for (int i = 0; i < kPasses; ++i) {
    passes.emplace_back([&] {
      try {
        completed.fetch_add(static_cast<int>(scheduler->ProcessDue(due).completed));
      } catch (const std::exception&) {
        errors.fetch_add(1);
      }
    });
  }
  for (auto& pass : passes) {
    pass.join();
  }

  assert(errors.load() == 0);
  assert(completed.load() == 1);
  assert(provider->Calls() == 1);
  assert(scheduler->Get(payout.id)->status == PayoutStatus::kCompleted);
}

void TestOperatorActions() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();
  auto scheduler  = MakeScheduler(repository, nullptr);

  const auto first  = scheduler->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  const auto second = scheduler->Schedule(CompletedBooking("booking-2"), kCompletedAt);

  const auto cancelled = scheduler->Cancel(first.id, "provider disputed", "ops@example.com", kCompletedAt + 1h);
  assert(cancelled.status == PayoutStatus::kCancelled);
  assert(cancelled.failure_reason == "provider disputed");

  bool threw = false;
  try {
    (void)scheduler->Cancel(first.id, "", "ops@example.com", kCompletedAt + 2h);
  } catch (const booking::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)scheduler->Cancel(second.id, "", "", kCompletedAt + 2h);
  } catch (const booking::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto settled = scheduler->ManuallyComplete(second.id, "wire-42", "ops@example.com", "paid by wire", kCompletedAt + 3h);
  assert(settled.status == PayoutStatus::kCompleted);
  assert(settled.external_transfer_id == "wire-42");

  threw = false;
  try {
    (void)scheduler->ManuallyComplete(second.id, "wire-43", "ops@example.com", "", kCompletedAt + 4h);
  } catch (const booking::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)scheduler->Cancel("payout-missing", "", "ops@example.com", kCompletedAt);
  } catch (const booking::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto stats = scheduler->Stats("provider-1");
  assert(stats.cancelled == 1);
  assert(stats.completed == 1);
  assert(stats.scheduled == 0);
  assert(stats.completed_value_cents == 9'000);
  assert(stats.pending_value_cents == 0);
}

void TestStatsReportOldestPendingAndFailureRate() {
  auto repository = std::make_shared<booking::db::memory::MemoryRepository>();

  auto empty = MakeScheduler(repository, std::make_shared<FakeProvider>(Behavior::kSucceed))->Stats("provider-1");
  assert(empty.oldest_pending_scheduled_at_ms == 0);
  assert(empty.failure_rate == 0.0);

  auto rejecting = MakeScheduler(repository, std::make_shared<FakeProvider>(Behavior::kPermanent));
  (void)rejecting->Schedule(CompletedBooking("booking-1"), kCompletedAt);
  assert(rejecting->ProcessDue(kCompletedAt + std::chrono::days(7)).failed == 1);

  auto paying = MakeScheduler(repository, std::make_shared<FakeProvider>(Behavior::kSucceed));
  (void)paying->Schedule(CompletedBooking("booking-2"), kCompletedAt + std::chrono::days(1));
  const auto older = paying->Schedule(CompletedBooking("booking-3"), kCompletedAt + std::chrono::days(2));
  (void)paying->Schedule(CompletedBooking("booking-4"), kCompletedAt + std::chrono::days(3));
  assert(paying->ProcessDue(kCompletedAt + std::chrono::days(8)).completed == 1);

  const auto stats = paying->Stats("provider-1");
  assert(stats.failed == 1);
  assert(stats.completed == 1);
  assert(stats.scheduled == 2);
  assert(stats.failure_rate == 0.5);
  assert(stats.oldest_pending_scheduled_at_ms == older.scheduled_at_ms);
  assert(stats.pending_value_cents == 18'000);
}

} // namespace

int main() {
  TestPayoutIsHeldForEscrow();
  TestSecondPayoutForBookingIsRejected();
  TestTransientFailuresBackOffThenFail();
  TestPermanentFailureIsTerminal();
  TestMissingProviderKeepsPayoutScheduled();
  TestConcurrentPassesTransferOnce();
  TestOperatorActions();
  TestStatsReportOldestPendingAndFailureRate();

  std::cout << "booking_engine_unit_payout_scheduler: pass\n";
  return 0;
}
