#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

struct ProviderRecord {
  std::string id;
  std::string display_name;

  // Fixed offset of the provider's wall clock from UTC.
  int32_t utc_offset_minutes = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace booking::db::model
