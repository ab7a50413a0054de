#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace booking::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  ConflictError carries its blocking booking id and alternative slots
  in the status details as a serialized GetAvailabilityResponse.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace booking::grpc
