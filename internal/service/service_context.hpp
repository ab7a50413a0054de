#pragma once

#include <memory>

namespace booking::db {
class Repository;
}
namespace booking::availability {
class AvailabilityService;
}
namespace booking::lock {
class SlotLockManager;
}
namespace booking::core {
class BookingCoordinator;
class BookingStateMachine;
} // namespace booking::core
namespace booking::payout {
class PayoutScheduler;
}

namespace booking::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<booking::db::Repository>                    repository;
  std::shared_ptr<booking::availability::AvailabilityService> availability;
  std::shared_ptr<booking::lock::SlotLockManager>             locks;
  std::shared_ptr<booking::core::BookingCoordinator>          coordinator;
  std::shared_ptr<booking::core::BookingStateMachine>         state_machine;
  std::shared_ptr<booking::payout::PayoutScheduler>           payouts;
};

} // namespace booking::service
