#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/payout/payment_provider.hpp"
#include "internal/service/service_context.hpp"

namespace booking::grpc {

// Transport adapters for every engine service.
std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const booking::service::ServiceContext& ctx);

// Null when no gateway target is configured.
std::shared_ptr<booking::payout::PaymentProvider> BuildPaymentProvider(const booking::runtime::config::PaymentGatewayConfig& config);

} // namespace booking::grpc
