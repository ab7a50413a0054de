#include "schedule_server.hpp"

#include "grpc_error.hpp"

namespace booking::grpc {

using namespace booking::engine::v1;

ScheduleServer::ScheduleServer(std::shared_ptr<booking::service::ScheduleService> svc) : service_(std::move(svc)) {
}

::grpc::Status ScheduleServer::UpsertProvider(::grpc::ServerContext*, const UpsertProviderRequest* req, UpsertProviderResponse* resp) {
  try {
    *resp = service_->UpsertProvider(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::SetWeeklySchedule(::grpc::ServerContext*, const SetWeeklyScheduleRequest* req, SetWeeklyScheduleResponse* resp) {
  try {
    *resp = service_->SetWeeklySchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::BlockSlot(::grpc::ServerContext*, const BlockSlotRequest* req, BlockSlotResponse* resp) {
  try {
    *resp = service_->BlockSlot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::UnblockSlot(::grpc::ServerContext*, const UnblockSlotRequest* req, UnblockSlotResponse*) {
  try {
    service_->UnblockSlot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace booking::grpc
