#include "grpc_error.hpp"

#include "booking/engine/v1/booking_service.pb.h"
#include "internal/db/api/transaction.hpp"
#include "internal/service/proto_convert.hpp"

namespace booking::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace booking::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* conflict = dynamic_cast<const ConflictError*>(&e)) {
    booking::engine::v1::GetAvailabilityResponse alternatives;
    for (const auto& slot : conflict->Alternatives()) {
      *alternatives.add_slots() = booking::service::ToProto(slot);
    }
    std::string message = e.what();
    if (!conflict->BlockingBookingId().empty()) {
      message += " (blocking booking " + conflict->BlockingBookingId() + ")";
    }
    return {::grpc::StatusCode::ABORTED, message, alternatives.SerializeAsString()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidTransitionError*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const booking::db::CommitConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace booking::grpc
