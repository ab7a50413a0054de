#include "booking_state_machine.hpp"

#include <stdexcept>

#include "fee_policy.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace booking::core {

using model::BookingStatus;

BookingStateMachine::BookingStateMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                                         std::shared_ptr<payout::PayoutScheduler> payouts, std::shared_ptr<events::EventSink> events,
                                         BookingOptions options)
    : repository_(std::move(repository)),
      availability_(std::move(availability)),
      payouts_(std::move(payouts)),
      events_(std::move(events)),
      options_(options) {
  if (!repository_ || !payouts_) {
    throw std::invalid_argument("BookingStateMachine requires a repository and a payout scheduler");
  }
  if (!events_) {
    events_ = std::make_shared<events::LoggingEventSink>();
  }
}

int64_t BookingStateMachine::CancellationFee(const db::model::BookingRecord& booking, int32_t utc_offset_minutes, util::TimePoint now) const {
  if (booking.status != BookingStatus::kConfirmed) {
    return 0;
  }
  const auto starts_at = util::LocalToInstant(util::ParseDate(booking.date), booking.start_minute, utc_offset_minutes);
  if (starts_at - now >= options_.late_cancel_window) {
    return 0;
  }
  return FeePolicy::PercentOf(booking.total_cents, options_.late_cancel_fee_percent);
}

db::model::BookingRecord BookingStateMachine::Transition(const std::string& booking_id, BookingStatus target, const std::string& triggered_by,
                                                         const std::string& reason, util::TimePoint now) {
  observability::SpanScope span("booking.transition");
  span.SetAttribute("booking.id", booking_id);
  span.SetAttribute("booking.target", model::ToString(target));

  if (booking_id.empty()) {
    throw util::ValidationError("booking_id is required");
  }
  if (triggered_by.empty()) {
    throw util::ValidationError("triggered_by is required");
  }

  const auto now_ms = util::ToUnixMillis(now);

  BookingStatus                          from = BookingStatus::kPending;
  db::model::BookingRecord               updated;
  std::optional<db::model::PayoutRecord> payout;

  db::RetryOnCommitConflict(options_.max_commit_attempts, [&] {
    payout.reset();

    auto tx      = repository_->Begin();
    auto current = repository_->GetBooking(*tx, booking_id);
    if (!current) {
      throw util::NotFound("booking not found: " + booking_id);
    }
    from = current->status;
    if (!model::CanTransition(from, target)) {
      throw util::InvalidTransitionError(from, target);
    }

    updated               = *current;
    updated.status        = target;
    updated.updated_at_ms = now_ms;
    updated.version       = current->version + 1;

    if (target == BookingStatus::kCancelled) {
      auto          provider = repository_->GetProvider(*tx, current->provider_id);
      const int32_t offset   = provider ? provider->utc_offset_minutes : 0;

      updated.cancelled_at_ms        = now_ms;
      updated.cancelled_by           = triggered_by;
      updated.cancellation_reason    = reason;
      updated.cancellation_fee_cents = CancellationFee(*current, offset, now);

      if (updated.cancellation_fee_cents > 0) {
        db::model::LedgerEntryRecord entry;
        entry.id            = util::NewId();
        entry.booking_id    = booking_id;
        entry.kind          = "cancellation_fee";
        entry.amount_cents  = updated.cancellation_fee_cents;
        entry.currency      = current->currency;
        entry.created_at_ms = now_ms;
        db::ThrowIfDbError(repository_->InsertLedgerEntry(*tx, entry), "insert cancellation fee");
      }
    }

    auto written = repository_->UpdateBooking(*tx, updated, current->version);
    if (written.Is(db::ErrorCode::ConstraintViolation)) {
      throw util::ConflictError("booking " + booking_id + " overlaps an active booking");
    }
    db::ThrowIfDbError(written, "update booking");

    db::model::TransitionRecord record;
    record.id            = util::NewId();
    record.booking_id    = booking_id;
    record.from_status   = from;
    record.to_status     = target;
    record.triggered_by  = triggered_by;
    record.reason        = reason;
    record.created_at_ms = now_ms;
    db::ThrowIfDbError(repository_->InsertTransition(*tx, record), "insert booking transition");

    if (target == BookingStatus::kCompleted) {
      payout = payouts_->ScheduleInTransaction(*tx, updated, now);
    }

    tx->Commit();
  });

  if (availability_ && model::OccupiesSlot(from) != model::OccupiesSlot(target)) {
    availability_->Invalidate(updated.provider_id, util::ParseDate(updated.date));
  }

  observability::Metrics::Instance().RecordBookingTransition(model::ToString(target));
  BOOKING_LOG_INFO("booking transitioned",
                   {observability::StringField("booking_id", booking_id), observability::StringField("from", model::ToString(from)),
                    observability::StringField("to", model::ToString(target)), observability::StringField("triggered_by", triggered_by),
                    observability::MoneyField("cancellation_fee", updated.cancellation_fee_cents, updated.currency)});

  events::Event event;
  event.type       = "booking." + std::string(model::ToString(target));
  event.subject_id = booking_id;
  event.attributes = {{"provider_id", updated.provider_id},
                      {"from", std::string(model::ToString(from))},
                      {"triggered_by", triggered_by}};
  if (!reason.empty()) {
    event.attributes.emplace_back("reason", reason);
  }
  if (updated.cancellation_fee_cents > 0) {
    event.attributes.emplace_back("cancellation_fee_cents", std::to_string(updated.cancellation_fee_cents));
  }
  events_->Publish(event);

  if (payout) {
    BOOKING_LOG_INFO("payout scheduled", {observability::StringField("payout_id", payout->id), observability::StringField("booking_id", booking_id),
                                          observability::MoneyField("amount", payout->amount_cents, payout->currency),
                                          observability::InstantField("scheduled_at", payout->scheduled_at_ms)});
    events_->Publish(events::Event{"payout.scheduled",
                                   payout->id,
                                   {{"booking_id", booking_id},
                                    {"provider_id", payout->provider_id},
                                    {"amount_cents", std::to_string(payout->amount_cents)},
                                    {"currency", payout->currency}}});
  }
  return updated;
}

std::vector<db::model::TransitionRecord> BookingStateMachine::History(const std::string& booking_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetBooking(*tx, booking_id)) {
    throw util::NotFound("booking not found: " + booking_id);
  }
  auto rows = repository_->ListTransitions(*tx, booking_id);
  tx->Commit();
  return rows;
}

std::vector<db::model::LedgerEntryRecord> BookingStateMachine::Ledger(const std::string& booking_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListLedgerEntries(*tx, booking_id);
  tx->Commit();
  return rows;
}

} // namespace booking::core
