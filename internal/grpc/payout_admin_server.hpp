#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "booking/engine/v1/payout_admin_service.grpc.pb.h"
#include "internal/service/payout_admin_service.hpp"

namespace booking::grpc {

class PayoutAdminServer final : public booking::engine::v1::PayoutAdminService::Service {
 public:
  explicit PayoutAdminServer(std::shared_ptr<booking::service::PayoutAdminService> svc);

  ::grpc::Status GetPayout(::grpc::ServerContext*, const booking::engine::v1::GetPayoutRequest*, booking::engine::v1::GetPayoutResponse*) override;

  ::grpc::Status ListPayouts(::grpc::ServerContext*, const booking::engine::v1::ListPayoutsRequest*, booking::engine::v1::ListPayoutsResponse*) override;

  ::grpc::Status PayoutStats(::grpc::ServerContext*, const booking::engine::v1::PayoutStatsRequest*, booking::engine::v1::PayoutStatsResponse*) override;

  ::grpc::Status CancelPayout(::grpc::ServerContext*, const booking::engine::v1::CancelPayoutRequest*, booking::engine::v1::CancelPayoutResponse*) override;

  ::grpc::Status ManuallyCompletePayout(::grpc::ServerContext*, const booking::engine::v1::ManuallyCompletePayoutRequest*, booking::engine::v1::ManuallyCompletePayoutResponse*) override;

  ::grpc::Status ProcessDuePayouts(::grpc::ServerContext*, const booking::engine::v1::ProcessDuePayoutsRequest*, booking::engine::v1::ProcessDuePayoutsResponse*) override;

 private:
  std::shared_ptr<booking::service::PayoutAdminService> service_;
};

} // namespace booking::grpc
