#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/slot_lock_record.hpp"
#include "internal/model/time_slot.hpp"

namespace booking::lock {

/*
  Outcome of an acquire attempt. A contested slot is a normal result,
  not an error: the caller shows the alternatives.
*/
struct AcquireResult {
  bool                                     acquired = false;
  std::optional<db::model::SlotLockRecord> lock;
  std::vector<model::TimeSlot>             alternatives;
  std::string                              reason; // why the slot was contested
};

struct SweepStats {
  uint64_t locks_deleted      = 0;
  uint64_t cache_rows_deleted = 0;
};

} // namespace booking::lock
