#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/util/time.hpp"
#include "payment_provider.hpp"
#include "retry_policy.hpp"

namespace booking::payout {

struct PayoutOptions {
  uint32_t                  escrow_days = 7;
  uint32_t                  batch_limit = 50;
  std::chrono::milliseconds transfer_timeout{std::chrono::seconds(30)};
};

struct ProcessStats {
  uint32_t claimed   = 0;
  uint32_t completed = 0;
  uint32_t retried   = 0;
  uint32_t failed    = 0;
};

struct PayoutStats {
  uint64_t scheduled             = 0;
  uint64_t processing            = 0;
  uint64_t completed             = 0;
  uint64_t failed                = 0;
  uint64_t cancelled             = 0;
  int64_t  completed_value_cents = 0;
  int64_t  pending_value_cents   = 0; // scheduled + processing

  // Earliest scheduled_at_ms among pending payouts; 0 when none are pending.
  uint64_t oldest_pending_scheduled_at_ms = 0;
  // failed / (completed + failed); 0 before any payout settles.
  double   failure_rate                   = 0.0;
};

/*
  Escrowed provider payouts.

  Processing is flip-then-act: due rows are claimed (SCHEDULED ->
  PROCESSING) in one short committed transaction, the provider is called
  outside any transaction, and the outcome is written in a second one.
  A payout claimed by one pass is invisible to every other pass, so each
  due payout produces at most one transfer call per claim.
*/
class PayoutScheduler {
 public:
  PayoutScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<PaymentProvider> provider, std::shared_ptr<RetryPolicy> retry_policy,
                  std::shared_ptr<events::EventSink> events, PayoutOptions options);

  // Writes the payout for a booking that just reached COMPLETED, inside the
  // caller's transaction. Throws util::AlreadyExists for a second payout.
  db::model::PayoutRecord ScheduleInTransaction(db::Transaction& tx, const db::model::BookingRecord& booking, util::TimePoint completed_at);

  // Same, in its own transaction.
  db::model::PayoutRecord Schedule(const db::model::BookingRecord& booking, util::TimePoint completed_at);

  ProcessStats ProcessDue(util::TimePoint now, uint32_t limit = 0);

  // Only SCHEDULED payouts can be cancelled.
  db::model::PayoutRecord Cancel(const std::string& payout_id, const std::string& reason, const std::string& performed_by, util::TimePoint now);

  // Marks any payout that is not already COMPLETED as paid out of band.
  db::model::PayoutRecord ManuallyComplete(const std::string& payout_id, const std::string& external_transaction_id,
                                           const std::string& performed_by, const std::string& notes, util::TimePoint now);

  std::optional<db::model::PayoutRecord> Get(const std::string& payout_id);
  std::optional<db::model::PayoutRecord> GetByBooking(const std::string& booking_id);
  std::vector<db::model::PayoutRecord>   List(const db::PayoutFilter& filter);
  PayoutStats                            Stats(const std::string& provider_id);

  static std::string IdempotencyKey(const std::string& payout_id) {
    return "payout-" + payout_id;
  }

 private:
  enum class Outcome { kCompleted, kRetried, kFailed, kSkipped };

  Outcome Attempt(const db::model::PayoutRecord& claimed, util::TimePoint now);
  Outcome Finish(const std::string& payout_id, util::TimePoint now, const std::optional<std::string>& transfer_id, const std::string& failure,
                 bool transient);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<PaymentProvider>   provider_;
  std::shared_ptr<RetryPolicy>       retry_policy_;
  std::shared_ptr<events::EventSink> events_;
  PayoutOptions                      options_;
};

} // namespace booking::payout
