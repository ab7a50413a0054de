#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/booking_status.hpp"

namespace booking::db::model {

// Append-only audit row. from_status is empty for the creation record.
struct TransitionRecord {
  std::string                                  id;
  std::string                                  booking_id;
  std::optional<booking::model::BookingStatus> from_status;
  booking::model::BookingStatus                to_status = booking::model::BookingStatus::kPending;
  std::string                                  triggered_by;
  std::string                                  reason;
  uint64_t                                     created_at_ms = 0;
};

} // namespace booking::db::model
