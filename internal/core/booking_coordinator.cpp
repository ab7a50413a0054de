#include "booking_coordinator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/availability/slot_calculator.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace booking::core {

namespace {

constexpr int         kCodeGenerationAttempts = 10;
constexpr std::size_t kMinCodeLength          = 4;
constexpr std::size_t kMaxCodeLength          = 32;

bool ValidEmail(const std::string& email) {
  const auto at = email.find('@');
  return at != std::string::npos && at > 0 && at + 1 < email.size() && email.find('@', at + 1) == std::string::npos;
}

bool ValidCode(const std::string& code) {
  if (code.size() < kMinCodeLength || code.size() > kMaxCodeLength) {
    return false;
  }
  return std::all_of(code.begin(), code.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
  });
}

struct Rejection {
  std::string blocking_booking_id;
  std::string message;
};

} // namespace

BookingCoordinator::BookingCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                                       std::shared_ptr<lock::SlotLockManager> locks, FeePolicy fees, std::shared_ptr<events::EventSink> events,
                                       BookingOptions options)
    : repository_(std::move(repository)),
      availability_(std::move(availability)),
      locks_(std::move(locks)),
      fees_(std::move(fees)),
      events_(std::move(events)),
      options_(options) {
  if (!repository_ || !availability_) {
    throw std::invalid_argument("BookingCoordinator requires a repository and an availability service");
  }
  if (!events_) {
    events_ = std::make_shared<events::LoggingEventSink>();
  }
  if (options_.confirmation_code_length == 0) {
    options_.confirmation_code_length = 6;
  }
}

void BookingCoordinator::Validate(const CreateBookingRequest& request) const {
  if (request.provider_id.empty()) {
    throw util::ValidationError("provider_id is required");
  }
  if (request.customer_id.empty() == request.guest_email.empty()) {
    throw util::ValidationError("exactly one of customer_id and guest_email is required");
  }
  if (!request.guest_email.empty() && !ValidEmail(request.guest_email)) {
    throw util::ValidationError("guest_email is not a valid address");
  }
  if (!request.date.ok()) {
    throw util::ValidationError("date is invalid");
  }
  if (request.start_minute >= request.end_minute) {
    throw util::ValidationError("start must be before end");
  }
  if (request.end_minute > model::kMinutesPerDay) {
    throw util::ValidationError("booking must end on the day it starts");
  }
  if (!request.confirmation_code.empty() && !ValidCode(request.confirmation_code)) {
    throw util::ValidationError("confirmation_code must be 4-32 characters of A-Z and 0-9");
  }
}

PriceBreakdown BookingCoordinator::ResolvePrice(const CreateBookingRequest& request) const {
  if (request.price) {
    return fees_.Normalize(*request.price);
  }
  return fees_.Compute(request.base_price_cents, !request.guest_email.empty());
}

std::string BookingCoordinator::UniqueConfirmationCode(db::Transaction& tx) const {
  for (int attempt = 0; attempt < kCodeGenerationAttempts; ++attempt) {
    auto code = util::GenerateConfirmationCode(options_.confirmation_code_length);
    if (!repository_->GetBookingByConfirmationCode(tx, code)) {
      return code;
    }
  }
  throw std::runtime_error("could not generate a unique confirmation code");
}

db::model::BookingRecord BookingCoordinator::CreateBooking(const CreateBookingRequest& request, util::TimePoint now) {
  observability::SpanScope span("booking.create");
  span.SetAttribute("booking.provider_id", request.provider_id);

  Validate(request);
  const auto price    = ResolvePrice(request);
  const auto date_key = util::FormatDate(request.date);
  const auto now_ms   = util::ToUnixMillis(now);
  const auto actor    = !request.triggered_by.empty() ? request.triggered_by
                        : !request.customer_id.empty() ? request.customer_id
                                                       : request.guest_email;

  std::optional<Rejection> rejection;
  db::model::BookingRecord booking;

  db::RetryOnCommitConflict(options_.max_commit_attempts, [&] {
    rejection.reset();

    auto tx       = repository_->Begin();
    auto provider = repository_->GetProvider(*tx, request.provider_id);
    if (!provider) {
      throw util::NotFound("provider not found: " + request.provider_id);
    }
    const auto starts_at = util::LocalToInstant(request.date, request.start_minute, provider->utc_offset_minutes);
    if (starts_at < now + availability_->Options().min_lead_time) {
      throw util::ValidationError("requested slot starts too soon");
    }

    db::ThrowIfDbError(repository_->LockProviderDate(*tx, request.provider_id, date_key), "lock provider date");

    const auto snapshot = availability::AvailabilityService::LoadSnapshot(*repository_, *tx, request.provider_id, request.date, request.date);

    if (const auto* existing =
            availability::SlotCalculator::FindConflict(snapshot.bookings, date_key, request.start_minute, request.end_minute)) {
      rejection = Rejection{existing->id, "requested slot overlaps booking " + existing->id};
      tx->Rollback();
      return;
    }
    if (!availability::SlotCalculator::FitsWindow(snapshot.windows, util::DayOfWeek(request.date), request.start_minute, request.end_minute)) {
      throw util::ValidationError("requested slot is outside the provider's working hours");
    }
    if (availability::SlotCalculator::IsBlocked(snapshot.blocks, date_key, request.start_minute, request.end_minute)) {
      throw util::ValidationError("requested slot is blocked by the provider");
    }

    if (!request.slot_lock_id.empty()) {
      auto held = repository_->GetSlotLock(*tx, request.slot_lock_id);
      if (held && (held->provider_id != request.provider_id || held->date != date_key ||
                   !model::Overlaps(held->start_minute, held->end_minute, request.start_minute, request.end_minute))) {
        throw util::ValidationError("slot lock " + request.slot_lock_id + " does not cover the requested slot");
      }
    }

    std::string code = request.confirmation_code;
    if (code.empty()) {
      code = UniqueConfirmationCode(*tx);
    } else if (repository_->GetBookingByConfirmationCode(*tx, code)) {
      throw util::AlreadyExists("confirmation code already in use: " + code);
    }

    booking                       = db::model::BookingRecord{};
    booking.id                    = util::NewId();
    booking.provider_id           = request.provider_id;
    booking.customer_id           = request.customer_id;
    booking.guest_email           = request.guest_email;
    booking.date                  = date_key;
    booking.start_minute          = request.start_minute;
    booking.end_minute            = request.end_minute;
    booking.status                = model::BookingStatus::kPending;
    booking.total_cents           = price.total_cents;
    booking.platform_fee_cents    = price.platform_fee_cents;
    booking.provider_payout_cents = price.provider_payout_cents;
    booking.currency              = price.currency;
    booking.confirmation_code     = code;
    booking.created_at_ms         = now_ms;
    booking.updated_at_ms         = now_ms;
    booking.version               = 1;

    auto inserted = repository_->InsertBooking(*tx, booking);
    if (inserted.Is(db::ErrorCode::ConstraintViolation)) {
      rejection = Rejection{{}, "requested slot was taken concurrently"};
      tx->Rollback();
      return;
    }
    if (inserted.Is(db::ErrorCode::AlreadyExists) && request.confirmation_code.empty()) {
      // Generated code raced another insert; draw again.
      throw db::CommitConflict("confirmation code collision");
    }
    db::ThrowIfDbError(inserted, "insert booking");

    db::model::TransitionRecord created;
    created.id            = util::NewId();
    created.booking_id    = booking.id;
    created.to_status     = model::BookingStatus::kPending;
    created.triggered_by  = actor;
    created.reason        = "created";
    created.created_at_ms = now_ms;
    db::ThrowIfDbError(repository_->InsertTransition(*tx, created), "insert booking transition");

    tx->Commit();
  });

  if (rejection && rejection->blocking_booking_id.empty()) {
    // The store refused the insert; the winning booking is committed by now.
    auto       tx       = repository_->Begin();
    const auto snapshot = availability::AvailabilityService::LoadSnapshot(*repository_, *tx, request.provider_id, request.date, request.date);
    tx->Commit();
    if (const auto* existing =
            availability::SlotCalculator::FindConflict(snapshot.bookings, date_key, request.start_minute, request.end_minute)) {
      rejection = Rejection{existing->id, "requested slot overlaps booking " + existing->id};
    }
  }

  if (rejection) {
    auto alternatives = availability_->FindAlternatives(request.provider_id, request.date, request.start_minute, request.end_minute, now);
    BOOKING_LOG_INFO("booking rejected",
                     {observability::StringField("provider_id", request.provider_id), observability::StringField("date", date_key),
                      observability::IntField("start_minute", request.start_minute), observability::IntField("end_minute", request.end_minute),
                      observability::StringField("blocking_booking_id", rejection->blocking_booking_id),
                      observability::IntField("alternatives", static_cast<std::int64_t>(alternatives.size()))});
    span.AddEvent("conflict");
    throw util::ConflictError(rejection->message, rejection->blocking_booking_id, std::move(alternatives));
  }

  availability_->Invalidate(request.provider_id, request.date);
  if (locks_ && !request.slot_lock_id.empty()) {
    try {
      locks_->Release(request.slot_lock_id);
    } catch (const std::exception& e) {
      // The lock expires on its own.
      BOOKING_LOG_WARN("slot lock release after booking failed",
                       {observability::StringField("lock_id", request.slot_lock_id), observability::StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().RecordBookingTransition(model::ToString(model::BookingStatus::kPending));
  BOOKING_LOG_INFO("booking created", {observability::StringField("booking_id", booking.id), observability::StringField("provider_id", booking.provider_id),
                                       observability::StringField("date", booking.date), observability::IntField("start_minute", booking.start_minute),
                                       observability::IntField("end_minute", booking.end_minute),
                                       observability::StringField("confirmation_code", booking.confirmation_code)});

  events::Event event;
  event.type       = "booking.created";
  event.subject_id = booking.id;
  event.attributes = {{"provider_id", booking.provider_id},
                      {"date", booking.date},
                      {"start_minute", std::to_string(booking.start_minute)},
                      {"end_minute", std::to_string(booking.end_minute)},
                      {"confirmation_code", booking.confirmation_code},
                      {"total_cents", std::to_string(booking.total_cents)}};
  events_->Publish(event);
  return booking;
}

std::optional<db::model::BookingRecord> BookingCoordinator::GetBooking(const std::string& booking_id) {
  auto tx      = repository_->Begin();
  auto booking = repository_->GetBooking(*tx, booking_id);
  tx->Commit();
  return booking;
}

std::optional<db::model::BookingRecord> BookingCoordinator::GetByConfirmationCode(const std::string& code) {
  auto tx      = repository_->Begin();
  auto booking = repository_->GetBookingByConfirmationCode(*tx, code);
  tx->Commit();
  return booking;
}

} // namespace booking::core
