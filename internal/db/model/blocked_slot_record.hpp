#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

struct BlockedSlotRecord {
  std::string id;
  std::string provider_id;
  std::string date; // YYYY-MM-DD

  // When set, start/end are ignored and the whole date is blocked.
  bool     full_day     = true;
  uint32_t start_minute = 0;
  uint32_t end_minute   = 0;

  std::string reason;
  uint64_t    created_at_ms = 0;
};

} // namespace booking::db::model
