#include "payout_scheduler.hpp"

#include <stdexcept>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace booking::payout {

using booking::model::PayoutStatus;

namespace {

constexpr uint32_t kMaxCommitAttempts = 5;

events::Event PayoutEvent(std::string type, const db::model::PayoutRecord& payout) {
  events::Event event;
  event.type       = std::move(type);
  event.subject_id = payout.id;
  event.attributes = {{"booking_id", payout.booking_id},
                      {"provider_id", payout.provider_id},
                      {"amount_cents", std::to_string(payout.amount_cents)},
                      {"currency", payout.currency},
                      {"retry_count", std::to_string(payout.retry_count)}};
  if (!payout.failure_reason.empty()) {
    event.attributes.emplace_back("reason", payout.failure_reason);
  }
  return event;
}

db::model::PayoutRecord RequirePayout(db::Repository& repository, db::Transaction& tx, const std::string& payout_id) {
  auto payout = repository.GetPayout(tx, payout_id);
  if (!payout) {
    throw util::NotFound("payout not found: " + payout_id);
  }
  return *payout;
}

} // namespace

PayoutScheduler::PayoutScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<PaymentProvider> provider,
                                 std::shared_ptr<RetryPolicy> retry_policy, std::shared_ptr<events::EventSink> events, PayoutOptions options)
    : repository_(std::move(repository)),
      provider_(std::move(provider)),
      retry_policy_(std::move(retry_policy)),
      events_(std::move(events)),
      options_(options) {
  if (!repository_) {
    throw std::invalid_argument("PayoutScheduler requires a repository");
  }
  if (!retry_policy_) {
    retry_policy_ = std::make_shared<ScheduleRetryPolicy>();
  }
  if (!events_) {
    events_ = std::make_shared<events::LoggingEventSink>();
  }
  if (options_.batch_limit == 0) {
    options_.batch_limit = 50;
  }
  if (!provider_) {
    BOOKING_LOG_WARN("no payment provider configured, due payouts stay scheduled");
  }
}

db::model::PayoutRecord PayoutScheduler::ScheduleInTransaction(db::Transaction& tx, const db::model::BookingRecord& booking,
                                                               util::TimePoint completed_at) {
  const auto now_ms = util::ToUnixMillis(completed_at);

  db::model::PayoutRecord payout;
  payout.id              = util::NewId();
  payout.booking_id      = booking.id;
  payout.provider_id     = booking.provider_id;
  payout.amount_cents    = booking.provider_payout_cents;
  payout.currency        = booking.currency;
  payout.status          = PayoutStatus::kScheduled;
  payout.scheduled_at_ms = util::ToUnixMillis(completed_at + std::chrono::days(options_.escrow_days));
  payout.created_at_ms   = now_ms;
  payout.updated_at_ms   = now_ms;

  db::ThrowIfDbError(repository_->InsertPayout(tx, payout), "schedule payout for booking " + booking.id);
  return payout;
}

db::model::PayoutRecord PayoutScheduler::Schedule(const db::model::BookingRecord& booking, util::TimePoint completed_at) {
  auto payout = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx     = repository_->Begin();
    auto record = ScheduleInTransaction(*tx, booking, completed_at);
    tx->Commit();
    return record;
  });
  events_->Publish(PayoutEvent("payout.scheduled", payout));
  return payout;
}

ProcessStats PayoutScheduler::ProcessDue(util::TimePoint now, uint32_t limit) {
  observability::SpanScope span("payout.process_due");
  ProcessStats             stats;

  // Nothing is claimed without a provider, so no retry budget is spent.
  if (!provider_) {
    BOOKING_LOG_DEBUG("payout pass skipped, no payment provider");
    return stats;
  }

  const uint32_t batch   = limit == 0 ? options_.batch_limit : limit;
  auto           claimed = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ClaimDuePayouts(*tx, util::ToUnixMillis(now), batch);
    tx->Commit();
    return rows;
  });
  stats.claimed = static_cast<uint32_t>(claimed.size());
  span.SetAttribute("payout.claimed", static_cast<std::int64_t>(stats.claimed));

  for (const auto& payout : claimed) {
    switch (Attempt(payout, now)) {
      case Outcome::kCompleted:
        ++stats.completed;
        break;
      case Outcome::kRetried:
        ++stats.retried;
        break;
      case Outcome::kFailed:
        ++stats.failed;
        break;
      case Outcome::kSkipped:
        break;
    }
  }

  if (stats.claimed > 0) {
    BOOKING_LOG_INFO("payout pass finished",
                     {observability::IntField("claimed", stats.claimed), observability::IntField("completed", stats.completed),
                      observability::IntField("retried", stats.retried), observability::IntField("failed", stats.failed)});
  }
  return stats;
}

PayoutScheduler::Outcome PayoutScheduler::Attempt(const db::model::PayoutRecord& claimed, util::TimePoint now) {
  TransferRequest request;
  request.idempotency_key = IdempotencyKey(claimed.id);
  request.payout_id       = claimed.id;
  request.provider_id     = claimed.provider_id;
  request.amount_cents    = claimed.amount_cents;
  request.currency        = claimed.currency;
  request.timeout         = options_.transfer_timeout;

  const auto started = std::chrono::steady_clock::now();
  auto       elapsed = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  };

  try {
    auto result = provider_->Transfer(request);
    observability::Metrics::Instance().ObservePayoutTransferMs(elapsed());
    return Finish(claimed.id, now, result.transfer_id, {}, false);
  } catch (const util::PermanentProviderError& e) {
    observability::Metrics::Instance().ObservePayoutTransferMs(elapsed());
    return Finish(claimed.id, now, std::nullopt, e.what(), false);
  } catch (const util::TransientProviderError& e) {
    observability::Metrics::Instance().ObservePayoutTransferMs(elapsed());
    return Finish(claimed.id, now, std::nullopt, e.what(), true);
  } catch (const std::exception& e) {
    // Unclassified provider failures are retried within the same budget.
    observability::Metrics::Instance().ObservePayoutTransferMs(elapsed());
    return Finish(claimed.id, now, std::nullopt, e.what(), true);
  }
}

PayoutScheduler::Outcome PayoutScheduler::Finish(const std::string& payout_id, util::TimePoint now, const std::optional<std::string>& transfer_id,
                                                 const std::string& failure, bool transient) {
  const auto now_ms = util::ToUnixMillis(now);

  Outcome                 outcome = Outcome::kSkipped;
  db::model::PayoutRecord payout;
  try {
    db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto tx = repository_->Begin();
      payout  = RequirePayout(*repository_, *tx, payout_id);
      if (payout.status != PayoutStatus::kProcessing) {
        // An operator settled or cancelled it while the transfer was in flight.
        outcome = Outcome::kSkipped;
        tx->Commit();
        return;
      }

      payout.updated_at_ms = now_ms;
      if (transfer_id) {
        payout.status               = PayoutStatus::kCompleted;
        payout.external_transfer_id = *transfer_id;
        payout.failure_reason.clear();
        payout.processed_at_ms = now_ms;
        outcome                = Outcome::kCompleted;
      } else if (transient && payout.retry_count + 1 <= retry_policy_->MaxRetries()) {
        payout.retry_count += 1;
        payout.status          = PayoutStatus::kScheduled;
        payout.scheduled_at_ms = util::ToUnixMillis(now + retry_policy_->Backoff(payout.retry_count));
        payout.failure_reason  = failure;
        outcome                = Outcome::kRetried;
      } else {
        if (transient) {
          payout.retry_count += 1;
        }
        payout.status         = PayoutStatus::kFailed;
        payout.failure_reason = failure;
        outcome               = Outcome::kFailed;
      }

      db::ThrowIfDbError(repository_->UpdatePayout(*tx, payout), "record payout outcome");
      tx->Commit();
    });
  } catch (const std::exception& e) {
    // The row stays PROCESSING for an operator to settle.
    BOOKING_LOG_ERROR("payout outcome not recorded",
                      {observability::StringField("payout_id", payout_id), observability::BoolField("transfer_succeeded", transfer_id.has_value()),
                       observability::StringField("error", e.what())});
    events::Event alert;
    alert.type       = "payout.outcome_not_recorded";
    alert.subject_id = payout_id;
    alert.attributes = {{"error", e.what()}};
    if (transfer_id) {
      alert.attributes.emplace_back("transfer_id", *transfer_id);
    }
    events_->Alert(alert);
    return Outcome::kSkipped;
  }

  switch (outcome) {
    case Outcome::kCompleted:
      observability::Metrics::Instance().RecordPayoutOutcome("completed");
      BOOKING_LOG_INFO("payout completed", {observability::StringField("payout_id", payout.id),
                                            observability::MoneyField("amount", payout.amount_cents, payout.currency),
                                            observability::StringField("transfer_id", payout.external_transfer_id)});
      events_->Publish(PayoutEvent("payout.completed", payout));
      break;
    case Outcome::kRetried:
      observability::Metrics::Instance().RecordPayoutOutcome("retried");
      BOOKING_LOG_WARN("payout transfer failed, retry scheduled",
                       {observability::StringField("payout_id", payout.id), observability::IntField("retry_count", payout.retry_count),
                        observability::InstantField("next_attempt_at", payout.scheduled_at_ms), observability::StringField("error", failure)});
      events_->Publish(PayoutEvent("payout.retry_scheduled", payout));
      break;
    case Outcome::kFailed:
      observability::Metrics::Instance().RecordPayoutOutcome("failed");
      BOOKING_LOG_ERROR("payout failed", {observability::StringField("payout_id", payout.id), observability::IntField("retry_count", payout.retry_count),
                                          observability::BoolField("transient", transient), observability::StringField("error", failure)});
      events_->Alert(PayoutEvent("payout.failed", payout));
      break;
    case Outcome::kSkipped:
      BOOKING_LOG_WARN("payout changed while transfer was in flight",
                       {observability::StringField("payout_id", payout_id), observability::StringField("status", std::string(model::ToString(payout.status)))});
      break;
  }
  return outcome;
}

db::model::PayoutRecord PayoutScheduler::Cancel(const std::string& payout_id, const std::string& reason, const std::string& performed_by,
                                                util::TimePoint now) {
  if (performed_by.empty()) {
    throw util::ValidationError("performed_by is required");
  }

  auto payout = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx     = repository_->Begin();
    auto record = RequirePayout(*repository_, *tx, payout_id);
    if (record.status != PayoutStatus::kScheduled) {
      throw util::InvalidState("payout " + payout_id + " is " + std::string(model::ToString(record.status)) + ", only scheduled payouts can be cancelled");
    }
    record.status         = PayoutStatus::kCancelled;
    record.failure_reason = reason.empty() ? "cancelled by " + performed_by : reason;
    record.updated_at_ms  = util::ToUnixMillis(now);
    db::ThrowIfDbError(repository_->UpdatePayout(*tx, record), "cancel payout");
    tx->Commit();
    return record;
  });

  BOOKING_LOG_INFO("payout cancelled", {observability::StringField("payout_id", payout_id), observability::StringField("performed_by", performed_by),
                                        observability::StringField("reason", payout.failure_reason)});
  auto event = PayoutEvent("payout.cancelled", payout);
  event.attributes.emplace_back("performed_by", performed_by);
  events_->Publish(event);
  return payout;
}

db::model::PayoutRecord PayoutScheduler::ManuallyComplete(const std::string& payout_id, const std::string& external_transaction_id,
                                                          const std::string& performed_by, const std::string& notes, util::TimePoint now) {
  if (external_transaction_id.empty() || performed_by.empty()) {
    throw util::ValidationError("external_transaction_id and performed_by are required");
  }

  auto payout = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx     = repository_->Begin();
    auto record = RequirePayout(*repository_, *tx, payout_id);
    if (record.status == PayoutStatus::kCompleted) {
      throw util::InvalidState("payout " + payout_id + " is already completed");
    }
    const auto now_ms           = util::ToUnixMillis(now);
    record.status               = PayoutStatus::kCompleted;
    record.external_transfer_id = external_transaction_id;
    record.failure_reason.clear();
    record.processed_at_ms = now_ms;
    record.updated_at_ms   = now_ms;
    db::ThrowIfDbError(repository_->UpdatePayout(*tx, record), "complete payout");
    tx->Commit();
    return record;
  });

  BOOKING_LOG_WARN("payout completed manually",
                   {observability::StringField("payout_id", payout_id), observability::StringField("external_transaction_id", external_transaction_id),
                    observability::StringField("performed_by", performed_by), observability::StringField("notes", notes)});
  auto event = PayoutEvent("payout.manually_completed", payout);
  event.attributes.emplace_back("performed_by", performed_by);
  if (!notes.empty()) {
    event.attributes.emplace_back("notes", notes);
  }
  events_->Publish(event);
  return payout;
}

std::optional<db::model::PayoutRecord> PayoutScheduler::Get(const std::string& payout_id) {
  auto tx     = repository_->Begin();
  auto payout = repository_->GetPayout(*tx, payout_id);
  tx->Commit();
  return payout;
}

std::optional<db::model::PayoutRecord> PayoutScheduler::GetByBooking(const std::string& booking_id) {
  auto tx     = repository_->Begin();
  auto payout = repository_->GetPayoutByBooking(*tx, booking_id);
  tx->Commit();
  return payout;
}

std::vector<db::model::PayoutRecord> PayoutScheduler::List(const db::PayoutFilter& filter) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListPayouts(*tx, filter);
  tx->Commit();
  return rows;
}

PayoutStats PayoutScheduler::Stats(const std::string& provider_id) {
  db::PayoutFilter filter;
  filter.provider_id = provider_id;
  filter.page.limit  = 0;

  PayoutStats stats;
  const auto  note_pending = [&stats](const db::model::PayoutRecord& payout) {
    stats.pending_value_cents += payout.amount_cents;
    if (stats.oldest_pending_scheduled_at_ms == 0 || payout.scheduled_at_ms < stats.oldest_pending_scheduled_at_ms) {
      stats.oldest_pending_scheduled_at_ms = payout.scheduled_at_ms;
    }
  };

  for (const auto& payout : List(filter)) {
    switch (payout.status) {
      case PayoutStatus::kScheduled:
        ++stats.scheduled;
        note_pending(payout);
        break;
      case PayoutStatus::kProcessing:
        ++stats.processing;
        note_pending(payout);
        break;
      case PayoutStatus::kCompleted:
        ++stats.completed;
        stats.completed_value_cents += payout.amount_cents;
        break;
      case PayoutStatus::kFailed:
        ++stats.failed;
        break;
      case PayoutStatus::kCancelled:
        ++stats.cancelled;
        break;
    }
  }

  const auto settled = stats.completed + stats.failed;
  if (settled > 0) {
    stats.failure_rate = static_cast<double>(stats.failed) / static_cast<double>(settled);
  }
  return stats;
}

} // namespace booking::payout
