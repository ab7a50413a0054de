#include "payment_gateway_client.hpp"

#include <grpcpp/client_context.h>

#include <chrono>
#include <string>

#include "internal/util/errors.hpp"

namespace booking::grpc {

GrpcPaymentProvider::GrpcPaymentProvider(std::shared_ptr<::grpc::Channel> channel)
    : stub_(booking::engine::v1::PaymentGateway::NewStub(std::move(channel))) {
}

bool GrpcPaymentProvider::IsTransient(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::INTERNAL:
    case ::grpc::StatusCode::ABORTED:
      return true;
    default:
      return false;
  }
}

booking::payout::TransferResult GrpcPaymentProvider::Transfer(const booking::payout::TransferRequest& request) {
  booking::engine::v1::TransferRequest wire;
  wire.set_idempotency_key(request.idempotency_key);
  wire.set_payout_id(request.payout_id);
  wire.set_provider_id(request.provider_id);
  wire.set_amount_cents(request.amount_cents);
  wire.set_currency(request.currency);

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + request.timeout);
  ctx.AddMetadata("idempotency-key", request.idempotency_key);

  booking::engine::v1::TransferResponse resp;
  const auto status = stub_->Transfer(&ctx, wire, &resp);
  if (!status.ok()) {
    const auto message = "transfer " + request.payout_id + " failed: " + status.error_message();
    if (IsTransient(status.error_code())) {
      throw booking::util::TransientProviderError(message);
    }
    throw booking::util::PermanentProviderError(message);
  }
  if (resp.transfer_id().empty()) {
    throw booking::util::PermanentProviderError("transfer " + request.payout_id + " returned no transfer id");
  }
  return booking::payout::TransferResult{resp.transfer_id()};
}

} // namespace booking::grpc
