#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "booking/engine/v1/booking_service.pb.h"
#include "internal/db/api/transaction.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/payment_gateway_client.hpp"
#include "internal/grpc/payout_admin_server.hpp"
#include "internal/grpc/schedule_server.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/payout_admin_service.hpp"
#include "internal/service/schedule_service.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = booking::engine::v1;

using booking::grpc::ToStatus;

booking::service::ServiceContext BuildServiceContext() {
  return booking::factory::BuildRuntime(booking::runtime::config::RuntimeConfig{}, nullptr).services;
}

void TestExceptionMapping() {
  assert(ToStatus(booking::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(booking::util::NotFound("missing")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(booking::util::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(booking::util::InvalidState("cancelled")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(booking::util::InvalidTransitionError(booking::model::BookingStatus::kCompleted, booking::model::BookingStatus::kCancelled))
             .error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(booking::db::CommitConflict("lost race")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestConflictCarriesAlternatives() {
  booking::model::TimeSlot slot;
  slot.date         = booking::util::ParseDate("2030-01-07");
  slot.start_minute = 16 * 60;
  slot.end_minute   = 17 * 60;
  slot.available    = true;

  const auto status = ToStatus(booking::util::ConflictError("requested slot overlaps booking b-1", "b-1", {slot}));
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
  assert(status.error_message().find("b-1") != std::string::npos);

  v1::GetAvailabilityResponse alternatives;
  assert(alternatives.ParseFromString(status.error_details()));
  assert(alternatives.slots_size() == 1);
  assert(alternatives.slots(0).date() == "2030-01-07");
  assert(alternatives.slots(0).start_minute() == 16 * 60);
}

void TestGetBookingMissingReturnsNotFound() {
  auto ctx = BuildServiceContext();

  booking::grpc::BookingServer server(std::make_shared<booking::service::BookingService>(ctx));

  v1::GetBookingRequest req;
  req.set_id("booking-missing");
  v1::GetBookingResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server.GetBooking(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedDateReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();

  booking::grpc::BookingServer server(std::make_shared<booking::service::BookingService>(ctx));

  v1::GetAvailabilityRequest req;
  req.set_provider_id("provider-1");
  req.set_date_from("2030-02-30");
  v1::GetAvailabilityResponse resp;
  ::grpc::ServerContext       grpc_ctx;

  const auto status = server.GetAvailability(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownProviderScheduleReturnsNotFound() {
  auto ctx = BuildServiceContext();

  booking::grpc::ScheduleServer server(std::make_shared<booking::service::ScheduleService>(ctx));

  v1::SetWeeklyScheduleRequest req;
  req.set_provider_id("provider-missing");
  v1::SetWeeklyScheduleResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  const auto status = server.SetWeeklySchedule(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCancelMissingPayoutReturnsNotFound() {
  auto ctx = BuildServiceContext();

  booking::grpc::PayoutAdminServer server(std::make_shared<booking::service::PayoutAdminService>(ctx));

  v1::CancelPayoutRequest req;
  req.set_payout_id("payout-missing");
  req.set_performed_by("ops@example.com");
  v1::CancelPayoutResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.CancelPayout(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestGatewayTransientCodes() {
  using booking::grpc::GrpcPaymentProvider;
  assert(GrpcPaymentProvider::IsTransient(::grpc::StatusCode::UNAVAILABLE));
  assert(GrpcPaymentProvider::IsTransient(::grpc::StatusCode::DEADLINE_EXCEEDED));
  assert(GrpcPaymentProvider::IsTransient(::grpc::StatusCode::RESOURCE_EXHAUSTED));
  assert(!GrpcPaymentProvider::IsTransient(::grpc::StatusCode::INVALID_ARGUMENT));
  assert(!GrpcPaymentProvider::IsTransient(::grpc::StatusCode::PERMISSION_DENIED));
}

} // namespace

int main() {
  TestExceptionMapping();
  TestConflictCarriesAlternatives();
  TestGetBookingMissingReturnsNotFound();
  TestMalformedDateReturnsInvalidArgument();
  TestUnknownProviderScheduleReturnsNotFound();
  TestCancelMissingPayoutReturnsNotFound();
  TestGatewayTransientCodes();

  std::cout << "booking_engine_unit_grpc_status: pass\n";
  return 0;
}
