#pragma once

#include "booking/engine/v1/booking_service.pb.h"
#include "service_context.hpp"

namespace booking::service {

class BookingService {
 public:
  explicit BookingService(ServiceContext ctx);

  booking::engine::v1::GetAvailabilityResponse GetAvailability(const booking::engine::v1::GetAvailabilityRequest& req);

  booking::engine::v1::AcquireSlotLockResponse AcquireSlotLock(const booking::engine::v1::AcquireSlotLockRequest& req);

  void ReleaseSlotLock(const booking::engine::v1::ReleaseSlotLockRequest& req);

  booking::engine::v1::CreateBookingResponse CreateBooking(const booking::engine::v1::CreateBookingRequest& req);

  booking::engine::v1::GetBookingResponse GetBooking(const booking::engine::v1::GetBookingRequest& req);

  booking::engine::v1::TransitionBookingResponse TransitionBooking(const booking::engine::v1::TransitionBookingRequest& req);

  booking::engine::v1::ListTransitionsResponse ListTransitions(const booking::engine::v1::ListTransitionsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
