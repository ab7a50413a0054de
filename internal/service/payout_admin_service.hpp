#pragma once

#include "booking/engine/v1/payout_admin_service.pb.h"
#include "service_context.hpp"

namespace booking::service {

class PayoutAdminService {
 public:
  explicit PayoutAdminService(ServiceContext ctx);

  booking::engine::v1::GetPayoutResponse GetPayout(const booking::engine::v1::GetPayoutRequest& req);

  booking::engine::v1::ListPayoutsResponse ListPayouts(const booking::engine::v1::ListPayoutsRequest& req);

  booking::engine::v1::PayoutStatsResponse PayoutStats(const booking::engine::v1::PayoutStatsRequest& req);

  booking::engine::v1::CancelPayoutResponse CancelPayout(const booking::engine::v1::CancelPayoutRequest& req);

  booking::engine::v1::ManuallyCompletePayoutResponse ManuallyCompletePayout(const booking::engine::v1::ManuallyCompletePayoutRequest& req);

  booking::engine::v1::ProcessDuePayoutsResponse ProcessDuePayouts(const booking::engine::v1::ProcessDuePayoutsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
