#pragma once

#include <cstdint>
#include <string>

namespace booking::db::model {

/*
  One cached slot of a (provider, date, duration) projection.
  Lagging read optimization only.
*/
struct AvailabilityCacheRecord {
  std::string provider_id;
  std::string date;
  uint32_t    start_minute  = 0;
  uint32_t    end_minute    = 0;
  bool        available     = false;
  uint64_t    expires_at_ms = 0;
};

} // namespace booking::db::model
