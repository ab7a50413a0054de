#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "booking/engine/v1/schedule_service.grpc.pb.h"
#include "internal/service/schedule_service.hpp"

namespace booking::grpc {

class ScheduleServer final : public booking::engine::v1::ScheduleService::Service {
 public:
  explicit ScheduleServer(std::shared_ptr<booking::service::ScheduleService> svc);

  ::grpc::Status UpsertProvider(::grpc::ServerContext*, const booking::engine::v1::UpsertProviderRequest*, booking::engine::v1::UpsertProviderResponse*) override;

  ::grpc::Status SetWeeklySchedule(::grpc::ServerContext*, const booking::engine::v1::SetWeeklyScheduleRequest*, booking::engine::v1::SetWeeklyScheduleResponse*) override;

  ::grpc::Status BlockSlot(::grpc::ServerContext*, const booking::engine::v1::BlockSlotRequest*, booking::engine::v1::BlockSlotResponse*) override;

  ::grpc::Status UnblockSlot(::grpc::ServerContext*, const booking::engine::v1::UnblockSlotRequest*, booking::engine::v1::UnblockSlotResponse*) override;

 private:
  std::shared_ptr<booking::service::ScheduleService> service_;
};

} // namespace booking::grpc
