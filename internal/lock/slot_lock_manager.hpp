#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/availability/availability_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "slot_lock.hpp"

namespace booking::lock {

struct SlotLockOptions {
  std::chrono::milliseconds default_ttl{std::chrono::minutes(10)};
  std::chrono::milliseconds max_ttl{std::chrono::minutes(30)};
};

/*
  Short-lived checkout claims on a slot.

  Locks live in the shared store so every instance sees them. They reduce
  double-booking races for the user but are not the guarantee: the
  booking coordinator re-checks under the store's own constraints.
*/
class SlotLockManager {
 public:
  SlotLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                  SlotLockOptions options);

  // The interval must be one of the offered slots and currently free.
  // The same session acquiring again extends its own lock.
  AcquireResult Acquire(const std::string& provider_id, util::Date date, uint32_t start_minute, uint32_t end_minute,
                        const std::string& session_id, std::optional<std::chrono::milliseconds> ttl, util::TimePoint now);

  // Idempotent. Returns true when a lock was removed.
  bool Release(const std::string& lock_id);

  std::optional<db::model::SlotLockRecord> Get(const std::string& lock_id);

  // Drops expired locks and expired cache rows.
  SweepStats Sweep(util::TimePoint now);

 private:
  std::shared_ptr<db::Repository>                    repository_;
  std::shared_ptr<availability::AvailabilityService> availability_;
  SlotLockOptions                                    options_;
};

} // namespace booking::lock
