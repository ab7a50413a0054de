#include "payout_admin_service.hpp"

#include <algorithm>
#include <optional>

#include "internal/db/api/types.hpp"
#include "internal/payout/payout_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace booking::service {

using namespace booking::engine::v1;

namespace {

constexpr uint32_t kMaxPageSize = 500;

} // namespace

PayoutAdminService::PayoutAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetPayoutResponse PayoutAdminService::GetPayout(const GetPayoutRequest& req) {
  const std::string key = req.has_booking_id() ? req.booking_id() : req.payout_id();
  return ObserveRpc("PayoutAdminService.GetPayout", key, [&] {
    std::optional<db::model::PayoutRecord> payout;
    switch (req.key_case()) {
      case GetPayoutRequest::kPayoutId:
        payout = ctx_.payouts->Get(req.payout_id());
        break;
      case GetPayoutRequest::kBookingId:
        payout = ctx_.payouts->GetByBooking(req.booking_id());
        break;
      default:
        throw util::ValidationError("payout_id or booking_id is required");
    }
    if (!payout) {
      throw util::NotFound("payout not found: " + key);
    }

    GetPayoutResponse resp;
    *resp.mutable_payout() = ToProto(*payout);
    return resp;
  });
}

ListPayoutsResponse PayoutAdminService::ListPayouts(const ListPayoutsRequest& req) {
  return ObserveRpc("PayoutAdminService.ListPayouts", req.provider_id(), [&] {
    db::PayoutFilter filter;
    filter.provider_id = req.provider_id();
    for (int i = 0; i < req.statuses_size(); ++i) {
      filter.statuses.push_back(FromProto(req.statuses(i)));
    }
    filter.page.limit  = req.limit() == 0 ? 100 : std::min(req.limit(), kMaxPageSize);
    filter.page.offset = req.offset();

    ListPayoutsResponse resp;
    for (const auto& payout : ctx_.payouts->List(filter)) {
      *resp.add_payouts() = ToProto(payout);
    }
    return resp;
  });
}

PayoutStatsResponse PayoutAdminService::PayoutStats(const PayoutStatsRequest& req) {
  return ObserveRpc("PayoutAdminService.PayoutStats", req.provider_id(), [&] {
    const auto stats = ctx_.payouts->Stats(req.provider_id());

    PayoutStatsResponse resp;
    resp.set_scheduled(stats.scheduled);
    resp.set_processing(stats.processing);
    resp.set_completed(stats.completed);
    resp.set_failed(stats.failed);
    resp.set_cancelled(stats.cancelled);
    resp.set_completed_value_cents(stats.completed_value_cents);
    resp.set_pending_value_cents(stats.pending_value_cents);
    if (stats.oldest_pending_scheduled_at_ms != 0) {
      *resp.mutable_oldest_pending_scheduled_at() = util::ToProto(util::FromUnixMillis(stats.oldest_pending_scheduled_at_ms));
    }
    resp.set_failure_rate(stats.failure_rate);
    return resp;
  });
}

CancelPayoutResponse PayoutAdminService::CancelPayout(const CancelPayoutRequest& req) {
  return ObserveRpc("PayoutAdminService.CancelPayout", req.payout_id(), [&] {
    CancelPayoutResponse resp;
    *resp.mutable_payout() = ToProto(ctx_.payouts->Cancel(req.payout_id(), req.reason(), req.performed_by(), util::Now()));
    return resp;
  });
}

ManuallyCompletePayoutResponse PayoutAdminService::ManuallyCompletePayout(const ManuallyCompletePayoutRequest& req) {
  return ObserveRpc("PayoutAdminService.ManuallyCompletePayout", req.payout_id(), [&] {
    ManuallyCompletePayoutResponse resp;
    *resp.mutable_payout() =
        ToProto(ctx_.payouts->ManuallyComplete(req.payout_id(), req.external_transaction_id(), req.performed_by(), req.notes(), util::Now()));
    return resp;
  });
}

ProcessDuePayoutsResponse PayoutAdminService::ProcessDuePayouts(const ProcessDuePayoutsRequest& req) {
  return ObserveRpc("PayoutAdminService.ProcessDuePayouts", {}, [&] {
    const auto stats = ctx_.payouts->ProcessDue(util::Now(), req.limit());

    ProcessDuePayoutsResponse resp;
    resp.set_claimed(stats.claimed);
    resp.set_completed(stats.completed);
    resp.set_retried(stats.retried);
    resp.set_failed(stats.failed);
    return resp;
  });
}

} // namespace booking::service
