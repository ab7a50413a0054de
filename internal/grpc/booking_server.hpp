#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "booking/engine/v1/booking_service.grpc.pb.h"
#include "internal/service/booking_service.hpp"

namespace booking::grpc {

class BookingServer final : public booking::engine::v1::BookingService::Service {
 public:
  explicit BookingServer(std::shared_ptr<booking::service::BookingService> svc);

  ::grpc::Status GetAvailability(::grpc::ServerContext*, const booking::engine::v1::GetAvailabilityRequest*, booking::engine::v1::GetAvailabilityResponse*) override;

  ::grpc::Status AcquireSlotLock(::grpc::ServerContext*, const booking::engine::v1::AcquireSlotLockRequest*, booking::engine::v1::AcquireSlotLockResponse*) override;

  ::grpc::Status ReleaseSlotLock(::grpc::ServerContext*, const booking::engine::v1::ReleaseSlotLockRequest*, booking::engine::v1::ReleaseSlotLockResponse*) override;

  ::grpc::Status CreateBooking(::grpc::ServerContext*, const booking::engine::v1::CreateBookingRequest*, booking::engine::v1::CreateBookingResponse*) override;

  ::grpc::Status GetBooking(::grpc::ServerContext*, const booking::engine::v1::GetBookingRequest*, booking::engine::v1::GetBookingResponse*) override;

  ::grpc::Status TransitionBooking(::grpc::ServerContext*, const booking::engine::v1::TransitionBookingRequest*, booking::engine::v1::TransitionBookingResponse*) override;

  ::grpc::Status ListTransitions(::grpc::ServerContext*, const booking::engine::v1::ListTransitionsRequest*, booking::engine::v1::ListTransitionsResponse*) override;

 private:
  std::shared_ptr<booking::service::BookingService> service_;
};

} // namespace booking::grpc
