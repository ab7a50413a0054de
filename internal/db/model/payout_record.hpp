#pragma once

#include <cstdint>
#include <string>

#include "internal/model/payout_status.hpp"

namespace booking::db::model {

/*
  Escrowed transfer to a provider. One per booking.
*/
struct PayoutRecord {
  std::string id;
  std::string booking_id;
  std::string provider_id;
  int64_t     amount_cents = 0;
  std::string currency;

  booking::model::PayoutStatus status = booking::model::PayoutStatus::kScheduled;

  uint64_t    scheduled_at_ms = 0;
  uint32_t    retry_count     = 0;
  std::string external_transfer_id;
  std::string failure_reason;
  uint64_t    processed_at_ms = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace booking::db::model
