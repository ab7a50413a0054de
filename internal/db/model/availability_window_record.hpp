#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

/*
  Weekly recurring window. Replaced windows are kept with active=false.
*/
struct AvailabilityWindowRecord {
  std::string id;
  std::string provider_id;
  uint32_t    day_of_week  = 0; // 0 = Sunday
  uint32_t    start_minute = 0;
  uint32_t    end_minute   = 0;
  bool        active       = true;
};

} // namespace booking::db::model
