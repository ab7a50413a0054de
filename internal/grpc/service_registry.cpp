#include "service_registry.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "booking_server.hpp"
#include "internal/observability/logging.hpp"
#include "payment_gateway_client.hpp"
#include "payout_admin_server.hpp"
#include "schedule_server.hpp"

namespace booking::grpc {

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const booking::service::ServiceContext& ctx) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<BookingServer>(std::make_shared<booking::service::BookingService>(ctx)));
  services.push_back(std::make_unique<ScheduleServer>(std::make_shared<booking::service::ScheduleService>(ctx)));
  services.push_back(std::make_unique<PayoutAdminServer>(std::make_shared<booking::service::PayoutAdminService>(ctx)));
  return services;
}

std::shared_ptr<booking::payout::PaymentProvider> BuildPaymentProvider(const booking::runtime::config::PaymentGatewayConfig& config) {
  if (config.target().empty()) {
    return nullptr;
  }
  BOOKING_LOG_INFO("payment gateway configured", {booking::observability::StringField("target", config.target())});
  return std::make_shared<GrpcPaymentProvider>(::grpc::CreateChannel(config.target(), ::grpc::InsecureChannelCredentials()));
}

} // namespace booking::grpc
