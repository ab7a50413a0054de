#include "payout_admin_server.hpp"

#include "grpc_error.hpp"

namespace booking::grpc {

using namespace booking::engine::v1;

PayoutAdminServer::PayoutAdminServer(std::shared_ptr<booking::service::PayoutAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status PayoutAdminServer::GetPayout(::grpc::ServerContext*, const GetPayoutRequest* req, GetPayoutResponse* resp) {
  try {
    *resp = service_->GetPayout(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PayoutAdminServer::ListPayouts(::grpc::ServerContext*, const ListPayoutsRequest* req, ListPayoutsResponse* resp) {
  try {
    *resp = service_->ListPayouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PayoutAdminServer::PayoutStats(::grpc::ServerContext*, const PayoutStatsRequest* req, PayoutStatsResponse* resp) {
  try {
    *resp = service_->PayoutStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PayoutAdminServer::CancelPayout(::grpc::ServerContext*, const CancelPayoutRequest* req, CancelPayoutResponse* resp) {
  try {
    *resp = service_->CancelPayout(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PayoutAdminServer::ManuallyCompletePayout(::grpc::ServerContext*, const ManuallyCompletePayoutRequest* req, ManuallyCompletePayoutResponse* resp) {
  try {
    *resp = service_->ManuallyCompletePayout(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PayoutAdminServer::ProcessDuePayouts(::grpc::ServerContext*, const ProcessDuePayoutsRequest* req, ProcessDuePayoutsResponse* resp) {
  try {
    *resp = service_->ProcessDuePayouts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace booking::grpc
