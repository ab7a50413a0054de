#include "proto_convert.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace booking::service {

namespace v1 = booking::engine::v1;

namespace {

// Zero means unset; the field is only created for a real instant.
template <typename MutableField>
void SetTimestamp(uint64_t ms, MutableField&& field) {
  if (ms != 0) {
    *field() = util::ToProto(util::FromUnixMillis(ms));
  }
}

} // namespace

v1::BookingStatus ToProto(model::BookingStatus status) {
  switch (status) {
    case model::BookingStatus::kPending:
      return v1::BOOKING_STATUS_PENDING;
    case model::BookingStatus::kConfirmed:
      return v1::BOOKING_STATUS_CONFIRMED;
    case model::BookingStatus::kInProgress:
      return v1::BOOKING_STATUS_IN_PROGRESS;
    case model::BookingStatus::kCompleted:
      return v1::BOOKING_STATUS_COMPLETED;
    case model::BookingStatus::kCancelled:
      return v1::BOOKING_STATUS_CANCELLED;
    case model::BookingStatus::kNoShow:
      return v1::BOOKING_STATUS_NO_SHOW;
    case model::BookingStatus::kRefunded:
      return v1::BOOKING_STATUS_REFUNDED;
    case model::BookingStatus::kPaymentFailed:
      return v1::BOOKING_STATUS_PAYMENT_FAILED;
  }
  return v1::BOOKING_STATUS_UNSPECIFIED;
}

v1::PayoutStatus ToProto(model::PayoutStatus status) {
  switch (status) {
    case model::PayoutStatus::kScheduled:
      return v1::PAYOUT_STATUS_SCHEDULED;
    case model::PayoutStatus::kProcessing:
      return v1::PAYOUT_STATUS_PROCESSING;
    case model::PayoutStatus::kCompleted:
      return v1::PAYOUT_STATUS_COMPLETED;
    case model::PayoutStatus::kFailed:
      return v1::PAYOUT_STATUS_FAILED;
    case model::PayoutStatus::kCancelled:
      return v1::PAYOUT_STATUS_CANCELLED;
  }
  return v1::PAYOUT_STATUS_UNSPECIFIED;
}

model::BookingStatus FromProto(v1::BookingStatus status) {
  switch (status) {
    case v1::BOOKING_STATUS_PENDING:
      return model::BookingStatus::kPending;
    case v1::BOOKING_STATUS_CONFIRMED:
      return model::BookingStatus::kConfirmed;
    case v1::BOOKING_STATUS_IN_PROGRESS:
      return model::BookingStatus::kInProgress;
    case v1::BOOKING_STATUS_COMPLETED:
      return model::BookingStatus::kCompleted;
    case v1::BOOKING_STATUS_CANCELLED:
      return model::BookingStatus::kCancelled;
    case v1::BOOKING_STATUS_NO_SHOW:
      return model::BookingStatus::kNoShow;
    case v1::BOOKING_STATUS_REFUNDED:
      return model::BookingStatus::kRefunded;
    case v1::BOOKING_STATUS_PAYMENT_FAILED:
      return model::BookingStatus::kPaymentFailed;
    default:
      break;
  }
  throw util::ValidationError("unknown booking status: " + std::to_string(static_cast<int>(status)));
}

model::PayoutStatus FromProto(v1::PayoutStatus status) {
  switch (status) {
    case v1::PAYOUT_STATUS_SCHEDULED:
      return model::PayoutStatus::kScheduled;
    case v1::PAYOUT_STATUS_PROCESSING:
      return model::PayoutStatus::kProcessing;
    case v1::PAYOUT_STATUS_COMPLETED:
      return model::PayoutStatus::kCompleted;
    case v1::PAYOUT_STATUS_FAILED:
      return model::PayoutStatus::kFailed;
    case v1::PAYOUT_STATUS_CANCELLED:
      return model::PayoutStatus::kCancelled;
    default:
      break;
  }
  throw util::ValidationError("unknown payout status: " + std::to_string(static_cast<int>(status)));
}

v1::TimeSlot ToProto(const model::TimeSlot& slot) {
  v1::TimeSlot out;
  out.set_date(util::FormatDate(slot.date));
  out.set_start_minute(slot.start_minute);
  out.set_end_minute(slot.end_minute);
  out.set_available(slot.available);
  return out;
}

v1::Booking ToProto(const db::model::BookingRecord& record) {
  v1::Booking out;
  out.set_id(record.id);
  out.set_provider_id(record.provider_id);
  out.set_customer_id(record.customer_id);
  out.set_guest_email(record.guest_email);
  out.set_date(record.date);
  out.set_start_minute(record.start_minute);
  out.set_end_minute(record.end_minute);
  out.set_status(ToProto(record.status));

  auto* price = out.mutable_price();
  price->set_total_cents(record.total_cents);
  price->set_platform_fee_cents(record.platform_fee_cents);
  price->set_provider_payout_cents(record.provider_payout_cents);
  price->set_currency(record.currency);

  out.set_confirmation_code(record.confirmation_code);
  SetTimestamp(record.cancelled_at_ms, [&] { return out.mutable_cancelled_at(); });
  out.set_cancelled_by(record.cancelled_by);
  out.set_cancellation_reason(record.cancellation_reason);
  out.set_cancellation_fee_cents(record.cancellation_fee_cents);
  SetTimestamp(record.created_at_ms, [&] { return out.mutable_created_at(); });
  SetTimestamp(record.updated_at_ms, [&] { return out.mutable_updated_at(); });
  out.set_version(record.version);
  return out;
}

v1::BookingTransition ToProto(const db::model::TransitionRecord& record) {
  v1::BookingTransition out;
  out.set_id(record.id);
  out.set_booking_id(record.booking_id);
  if (record.from_status) {
    out.set_from_status(ToProto(*record.from_status));
  }
  out.set_to_status(ToProto(record.to_status));
  out.set_triggered_by(record.triggered_by);
  out.set_reason(record.reason);
  SetTimestamp(record.created_at_ms, [&] { return out.mutable_created_at(); });
  return out;
}

v1::SlotLock ToProto(const db::model::SlotLockRecord& record) {
  v1::SlotLock out;
  out.set_lock_id(record.lock_id);
  out.set_provider_id(record.provider_id);
  out.set_date(record.date);
  out.set_start_minute(record.start_minute);
  out.set_end_minute(record.end_minute);
  out.set_session_id(record.session_id);
  SetTimestamp(record.locked_until_ms, [&] { return out.mutable_locked_until(); });
  return out;
}

v1::Payout ToProto(const db::model::PayoutRecord& record) {
  v1::Payout out;
  out.set_id(record.id);
  out.set_booking_id(record.booking_id);
  out.set_provider_id(record.provider_id);
  out.set_amount_cents(record.amount_cents);
  out.set_currency(record.currency);
  out.set_status(ToProto(record.status));
  SetTimestamp(record.scheduled_at_ms, [&] { return out.mutable_scheduled_at(); });
  out.set_retry_count(record.retry_count);
  out.set_external_transfer_id(record.external_transfer_id);
  out.set_failure_reason(record.failure_reason);
  SetTimestamp(record.processed_at_ms, [&] { return out.mutable_processed_at(); });
  SetTimestamp(record.created_at_ms, [&] { return out.mutable_created_at(); });
  SetTimestamp(record.updated_at_ms, [&] { return out.mutable_updated_at(); });
  return out;
}

v1::Provider ToProto(const db::model::ProviderRecord& record) {
  v1::Provider out;
  out.set_id(record.id);
  out.set_display_name(record.display_name);
  out.set_utc_offset_minutes(record.utc_offset_minutes);
  return out;
}

v1::AvailabilityWindow ToProto(const db::model::AvailabilityWindowRecord& record) {
  v1::AvailabilityWindow out;
  out.set_day_of_week(record.day_of_week);
  out.set_start_minute(record.start_minute);
  out.set_end_minute(record.end_minute);
  out.set_active(record.active);
  return out;
}

v1::BlockedSlot ToProto(const db::model::BlockedSlotRecord& record) {
  v1::BlockedSlot out;
  out.set_id(record.id);
  out.set_provider_id(record.provider_id);
  out.set_date(record.date);
  out.set_full_day(record.full_day);
  out.set_start_minute(record.start_minute);
  out.set_end_minute(record.end_minute);
  out.set_reason(record.reason);
  return out;
}

} // namespace booking::service
