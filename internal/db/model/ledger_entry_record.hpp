#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

// Compensating money movement attached to a booking. Append-only.
struct LedgerEntryRecord {
  std::string id;
  std::string booking_id;
  std::string kind;
  int64_t     amount_cents = 0;
  std::string currency;
  uint64_t    created_at_ms = 0;
};

} // namespace booking::db::model
