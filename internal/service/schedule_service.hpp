#pragma once

#include "booking/engine/v1/schedule_service.pb.h"
#include "service_context.hpp"

namespace booking::service {

/*
  Provider profile and schedule maintenance.

  Every change invalidates the cached availability it affects.
*/
class ScheduleService {
 public:
  explicit ScheduleService(ServiceContext ctx);

  booking::engine::v1::UpsertProviderResponse UpsertProvider(const booking::engine::v1::UpsertProviderRequest& req);

  booking::engine::v1::SetWeeklyScheduleResponse SetWeeklySchedule(const booking::engine::v1::SetWeeklyScheduleRequest& req);

  booking::engine::v1::BlockSlotResponse BlockSlot(const booking::engine::v1::BlockSlotRequest& req);

  void UnblockSlot(const booking::engine::v1::UnblockSlotRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
