#pragma once

#include <cstdint>
#include <string>

#include "internal/model/booking_status.hpp"

namespace booking::db::model {

/*
  Persistent booking row.

  IMPORTANT:
  - The booking table is the single source of truth for conflicts.
  - Rows are never deleted; cancellation is a status.
  - Version guards status updates against concurrent writers.
*/
struct BookingRecord {
  std::string id;
  std::string provider_id;

  // Exactly one of these is set.
  std::string customer_id;
  std::string guest_email;

  std::string date; // YYYY-MM-DD, provider-local
  uint32_t    start_minute = 0;
  uint32_t    end_minute   = 0;

  booking::model::BookingStatus status = booking::model::BookingStatus::kPending;

  int64_t     total_cents           = 0;
  int64_t     platform_fee_cents    = 0;
  int64_t     provider_payout_cents = 0;
  std::string currency;

  std::string confirmation_code;

  uint64_t    cancelled_at_ms = 0;
  std::string cancelled_by;
  std::string cancellation_reason;
  int64_t     cancellation_fee_cents = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace booking::db::model
