#pragma once

#include <grpcpp/channel.h>

#include <memory>

#include "booking/engine/v1/payment_gateway.grpc.pb.h"
#include "internal/payout/payment_provider.hpp"

namespace booking::grpc {

/*
  PaymentProvider backed by a remote PaymentGateway service.

  Every call carries the request's timeout as its deadline. Transport
  failures the gateway may recover from (UNAVAILABLE, DEADLINE_EXCEEDED,
  RESOURCE_EXHAUSTED, INTERNAL, ABORTED) are transient; anything else is
  permanent.
*/
class GrpcPaymentProvider final : public booking::payout::PaymentProvider {
 public:
  explicit GrpcPaymentProvider(std::shared_ptr<::grpc::Channel> channel);

  booking::payout::TransferResult Transfer(const booking::payout::TransferRequest& request) override;

  static bool IsTransient(::grpc::StatusCode code);

 private:
  std::unique_ptr<booking::engine::v1::PaymentGateway::Stub> stub_;
};

} // namespace booking::grpc
