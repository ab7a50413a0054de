#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

struct SlotLockRecord {
  std::string lock_id;
  std::string provider_id;
  std::string date;
  uint32_t    start_minute = 0;
  uint32_t    end_minute   = 0;
  std::string session_id;
  uint64_t    locked_until_ms = 0;
  uint64_t    created_at_ms   = 0;
};

} // namespace booking::db::model
