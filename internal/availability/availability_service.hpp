#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/time_slot.hpp"
#include "internal/util/time.hpp"
#include "slot_calculator.hpp"

namespace booking::availability {

struct AvailabilityOptions {
  uint32_t                  slot_granularity_minutes = 15;
  std::chrono::milliseconds cache_ttl{std::chrono::seconds(30)};
  uint32_t                  alternative_count   = 3;
  uint32_t                  search_horizon_days = 7;
  std::chrono::milliseconds min_lead_time{0};
  uint32_t                  max_range_days = 90;
};

/*
  Availability reads for one provider.

  The store's availability_cache table holds computed days keyed by
  (provider, date, duration). It is a lagging optimization: bookings are
  always re-checked by the coordinator, and every booking mutation or
  slot lock change invalidates the affected day.

  None of these methods may be called while the calling thread holds an
  open transaction.
*/
class AvailabilityService {
 public:
  AvailabilityService(std::shared_ptr<db::Repository> repository, AvailabilityOptions options);

  // Ordered slots for every date in [from, to]. duration 0 selects the granularity.
  std::vector<model::TimeSlot> GetAvailability(const std::string& provider_id, util::Date from, util::Date to, uint32_t duration_minutes,
                                               util::TimePoint now);

  // One day, served from the cache while it is fresh.
  std::vector<model::TimeSlot> CachedSlotsForDate(const std::string& provider_id, util::Date date, uint32_t duration_minutes, util::TimePoint now);

  // Free slots with the rejected interval's duration on `date` and the
  // following days, skipping anything overlapping the rejected interval or
  // an unexpired slot lock. At most alternative_count results.
  std::vector<model::TimeSlot> FindAlternatives(const std::string& provider_id, util::Date date, uint32_t start_minute, uint32_t end_minute,
                                                util::TimePoint now);

  // Advisory; failures are logged.
  void Invalidate(const std::string& provider_id, util::Date date);

  uint64_t PurgeExpiredCache(util::TimePoint now);

  // Reads the provider's windows, blocks and occupying bookings inside `tx`.
  static ScheduleSnapshot LoadSnapshot(db::Repository& repository, db::Transaction& tx, const std::string& provider_id, util::Date from,
                                       util::Date to);

  const AvailabilityOptions& Options() const {
    return options_;
  }

 private:
  uint32_t EffectiveDuration(uint32_t duration_minutes) const;
  void     ApplyLeadTime(std::vector<model::TimeSlot>& slots, int32_t utc_offset_minutes, util::TimePoint now) const;

  std::shared_ptr<db::Repository> repository_;
  AvailabilityOptions             options_;
};

} // namespace booking::availability
