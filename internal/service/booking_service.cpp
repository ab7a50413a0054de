#include "booking_service.hpp"

#include <chrono>
#include <optional>

#include "internal/availability/availability_service.hpp"
#include "internal/core/booking_coordinator.hpp"
#include "internal/core/booking_state_machine.hpp"
#include "internal/lock/slot_lock_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace booking::service {

using namespace booking::engine::v1;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

} // namespace

BookingService::BookingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetAvailabilityResponse BookingService::GetAvailability(const GetAvailabilityRequest& req) {
  return ObserveRpc("BookingService.GetAvailability", req.provider_id(), [&] {
    const auto from = util::ParseDate(req.date_from());
    const auto to   = req.date_to().empty() ? from : util::ParseDate(req.date_to());

    GetAvailabilityResponse resp;
    for (const auto& slot : ctx_.availability->GetAvailability(req.provider_id(), from, to, req.duration_minutes(), util::Now())) {
      *resp.add_slots() = ToProto(slot);
    }
    return resp;
  });
}

AcquireSlotLockResponse BookingService::AcquireSlotLock(const AcquireSlotLockRequest& req) {
  return ObserveRpc("BookingService.AcquireSlotLock", req.provider_id(), [&] {
    std::optional<std::chrono::milliseconds> ttl;
    if (req.has_ttl()) {
      ttl = ToMillis(req.ttl());
    }

    auto result = ctx_.locks->Acquire(req.provider_id(), util::ParseDate(req.date()), req.start_minute(), req.end_minute(), req.session_id(), ttl,
                                      util::Now());

    AcquireSlotLockResponse resp;
    resp.set_acquired(result.acquired);
    if (result.lock) {
      *resp.mutable_lock() = ToProto(*result.lock);
    }
    for (const auto& slot : result.alternatives) {
      *resp.add_alternatives() = ToProto(slot);
    }
    return resp;
  });
}

void BookingService::ReleaseSlotLock(const ReleaseSlotLockRequest& req) {
  ObserveRpc("BookingService.ReleaseSlotLock", req.lock_id(), [&] {
    if (req.lock_id().empty()) {
      throw util::ValidationError("lock_id is required");
    }
    ctx_.locks->Release(req.lock_id());
  });
}

CreateBookingResponse BookingService::CreateBooking(const booking::engine::v1::CreateBookingRequest& req) {
  return ObserveRpc("BookingService.CreateBooking", req.provider_id(), [&] {
    core::CreateBookingRequest request;
    request.provider_id  = req.provider_id();
    request.customer_id  = req.customer_id();
    request.guest_email  = req.guest_email();
    request.date         = util::ParseDate(req.date());
    request.start_minute = req.start_minute();
    request.end_minute   = req.end_minute();
    if (req.has_price()) {
      core::PriceBreakdown price;
      price.total_cents           = req.price().total_cents();
      price.platform_fee_cents    = req.price().platform_fee_cents();
      price.provider_payout_cents = req.price().provider_payout_cents();
      price.currency              = req.price().currency();
      request.price               = price;
    }
    request.base_price_cents  = req.base_price_cents();
    request.confirmation_code = req.confirmation_code();
    request.slot_lock_id      = req.slot_lock_id();

    CreateBookingResponse resp;
    *resp.mutable_booking() = ToProto(ctx_.coordinator->CreateBooking(request, util::Now()));
    return resp;
  });
}

GetBookingResponse BookingService::GetBooking(const GetBookingRequest& req) {
  const std::string key = req.has_confirmation_code() ? req.confirmation_code() : req.id();
  return ObserveRpc("BookingService.GetBooking", key, [&] {
    std::optional<db::model::BookingRecord> booking;
    switch (req.key_case()) {
      case GetBookingRequest::kId:
        booking = ctx_.coordinator->GetBooking(req.id());
        break;
      case GetBookingRequest::kConfirmationCode:
        booking = ctx_.coordinator->GetByConfirmationCode(req.confirmation_code());
        break;
      default:
        throw util::ValidationError("id or confirmation_code is required");
    }
    if (!booking) {
      throw util::NotFound("booking not found: " + key);
    }

    GetBookingResponse resp;
    *resp.mutable_booking() = ToProto(*booking);
    return resp;
  });
}

TransitionBookingResponse BookingService::TransitionBooking(const TransitionBookingRequest& req) {
  return ObserveRpc("BookingService.TransitionBooking", req.booking_id(), [&] {
    TransitionBookingResponse resp;
    *resp.mutable_booking() =
        ToProto(ctx_.state_machine->Transition(req.booking_id(), FromProto(req.target()), req.triggered_by(), req.reason(), util::Now()));
    return resp;
  });
}

ListTransitionsResponse BookingService::ListTransitions(const ListTransitionsRequest& req) {
  return ObserveRpc("BookingService.ListTransitions", req.booking_id(), [&] {
    ListTransitionsResponse resp;
    for (const auto& record : ctx_.state_machine->History(req.booking_id())) {
      *resp.add_transitions() = ToProto(record);
    }
    return resp;
  });
}

} // namespace booking::service
