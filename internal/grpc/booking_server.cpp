#include "booking_server.hpp"

#include "grpc_error.hpp"

namespace booking::grpc {

using namespace booking::engine::v1;

BookingServer::BookingServer(std::shared_ptr<booking::service::BookingService> svc) : service_(std::move(svc)) {
}

::grpc::Status BookingServer::GetAvailability(::grpc::ServerContext*, const GetAvailabilityRequest* req, GetAvailabilityResponse* resp) {
  try {
    *resp = service_->GetAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::AcquireSlotLock(::grpc::ServerContext*, const AcquireSlotLockRequest* req, AcquireSlotLockResponse* resp) {
  try {
    *resp = service_->AcquireSlotLock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ReleaseSlotLock(::grpc::ServerContext*, const ReleaseSlotLockRequest* req, ReleaseSlotLockResponse*) {
  try {
    service_->ReleaseSlotLock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::CreateBooking(::grpc::ServerContext*, const CreateBookingRequest* req, CreateBookingResponse* resp) {
  try {
    *resp = service_->CreateBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::GetBooking(::grpc::ServerContext*, const GetBookingRequest* req, GetBookingResponse* resp) {
  try {
    *resp = service_->GetBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::TransitionBooking(::grpc::ServerContext*, const TransitionBookingRequest* req, TransitionBookingResponse* resp) {
  try {
    *resp = service_->TransitionBooking(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ListTransitions(::grpc::ServerContext*, const ListTransitionsRequest* req, ListTransitionsResponse* resp) {
  try {
    *resp = service_->ListTransitions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace booking::grpc
