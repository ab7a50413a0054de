#include "availability_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace booking::availability {

namespace {

constexpr uint32_t kMaxAlternativeDays = 60;

int32_t RequireProviderOffset(db::Repository& repository, db::Transaction& tx, const std::string& provider_id) {
  auto provider = repository.GetProvider(tx, provider_id);
  if (!provider) {
    throw util::NotFound("provider not found: " + provider_id);
  }
  return provider->utc_offset_minutes;
}

} // namespace

AvailabilityService::AvailabilityService(std::shared_ptr<db::Repository> repository, AvailabilityOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("AvailabilityService requires a repository");
  }
  if (options_.slot_granularity_minutes == 0) {
    options_.slot_granularity_minutes = 15;
  }
}

ScheduleSnapshot AvailabilityService::LoadSnapshot(db::Repository& repository, db::Transaction& tx, const std::string& provider_id,
                                                   util::Date from, util::Date to) {
  const db::DateRange range{util::FormatDate(from), util::FormatDate(to)};

  ScheduleSnapshot snapshot;
  snapshot.windows  = repository.ListAvailabilityWindows(tx, provider_id);
  snapshot.blocks   = repository.ListBlockedSlots(tx, provider_id, range);
  snapshot.bookings = repository.ListOccupyingBookings(tx, provider_id, range);
  return snapshot;
}

uint32_t AvailabilityService::EffectiveDuration(uint32_t duration_minutes) const {
  const uint32_t duration = duration_minutes == 0 ? options_.slot_granularity_minutes : duration_minutes;
  if (duration > model::kMinutesPerDay) {
    throw util::ValidationError("slot duration exceeds one day");
  }
  return duration;
}

void AvailabilityService::ApplyLeadTime(std::vector<model::TimeSlot>& slots, int32_t utc_offset_minutes, util::TimePoint now) const {
  const auto not_before = now + options_.min_lead_time;
  for (auto& slot : slots) {
    if (slot.available && util::LocalToInstant(slot.date, slot.start_minute, utc_offset_minutes) < not_before) {
      slot.available = false;
    }
  }
}

std::vector<model::TimeSlot> AvailabilityService::GetAvailability(const std::string& provider_id, util::Date from, util::Date to,
                                                                  uint32_t duration_minutes, util::TimePoint now) {
  if (provider_id.empty()) {
    throw util::ValidationError("provider_id is required");
  }
  const int span = util::DaysBetween(from, to);
  if (span < 0) {
    throw util::ValidationError("date_from is after date_to");
  }
  if (options_.max_range_days > 0 && static_cast<uint32_t>(span) >= options_.max_range_days) {
    throw util::ValidationError("date range exceeds " + std::to_string(options_.max_range_days) + " days");
  }
  const uint32_t duration = EffectiveDuration(duration_minutes);

  std::vector<model::TimeSlot> out;
  for (int offset = 0; offset <= span; ++offset) {
    auto day = CachedSlotsForDate(provider_id, util::AddDays(from, offset), duration, now);
    out.insert(out.end(), day.begin(), day.end());
  }
  return out;
}

std::vector<model::TimeSlot> AvailabilityService::CachedSlotsForDate(const std::string& provider_id, util::Date date, uint32_t duration_minutes,
                                                                     util::TimePoint now) {
  const uint32_t duration = EffectiveDuration(duration_minutes);
  const auto     date_key = util::FormatDate(date);
  const auto     now_ms   = util::ToUnixMillis(now);

  auto tx = repository_->Begin();

  const int32_t offset = RequireProviderOffset(*repository_, *tx, provider_id);

  std::vector<model::TimeSlot> slots;
  auto                         cached = repository_->GetCachedSlots(*tx, provider_id, date_key, duration, now_ms);
  if (!cached.empty()) {
    tx->Commit();
    slots.reserve(cached.size());
    for (const auto& row : cached) {
      slots.push_back(model::TimeSlot{date, row.start_minute, row.end_minute, row.available});
    }
    ApplyLeadTime(slots, offset, now);
    return slots;
  }

  slots = SlotCalculator::SlotsForDate(LoadSnapshot(*repository_, *tx, provider_id, date, date), date, duration);

  // Lead time depends on `now`, so rows are stored without it.
  std::vector<db::model::AvailabilityCacheRecord> rows;
  rows.reserve(slots.size());
  const auto expires_at_ms = now_ms + static_cast<uint64_t>(options_.cache_ttl.count());
  for (const auto& slot : slots) {
    rows.push_back(db::model::AvailabilityCacheRecord{provider_id, date_key, slot.start_minute, slot.end_minute, slot.available, expires_at_ms});
  }

  if (!rows.empty() && options_.cache_ttl.count() > 0) {
    auto result = repository_->ReplaceCachedSlots(*tx, provider_id, date_key, duration, rows);
    if (!result) {
      BOOKING_LOG_WARN("availability cache write failed",
                       {observability::StringField("provider_id", provider_id), observability::StringField("date", date_key),
                        observability::StringField("code", std::string(db::ToString(result.code))),
                        observability::StringField("error", result.message)});
      tx->Rollback();
      ApplyLeadTime(slots, offset, now);
      return slots;
    }
  }

  try {
    tx->Commit();
  } catch (const db::CommitConflict& e) {
    BOOKING_LOG_DEBUG("availability cache write lost a race",
                      {observability::StringField("provider_id", provider_id), observability::StringField("error", e.what())});
  }

  ApplyLeadTime(slots, offset, now);
  return slots;
}

std::vector<model::TimeSlot> AvailabilityService::FindAlternatives(const std::string& provider_id, util::Date date, uint32_t start_minute,
                                                                   uint32_t end_minute, util::TimePoint now) {
  std::vector<model::TimeSlot> out;
  if (end_minute <= start_minute || options_.alternative_count == 0) {
    return out;
  }
  const uint32_t duration = end_minute - start_minute;
  const uint32_t horizon  = std::min(options_.search_horizon_days, kMaxAlternativeDays);
  const auto     now_ms   = util::ToUnixMillis(now);

  for (uint32_t day = 0; day <= horizon && out.size() < options_.alternative_count; ++day) {
    const auto candidate_date = util::AddDays(date, static_cast<int>(day));
    const auto date_key       = util::FormatDate(candidate_date);

    std::vector<model::TimeSlot>           slots;
    std::vector<db::model::SlotLockRecord> locks;
    int32_t                                offset = 0;
    {
      // Fresh read: alternatives must never point at a slot taken since the cache was filled.
      auto tx = repository_->Begin();
      offset  = RequireProviderOffset(*repository_, *tx, provider_id);
      slots   = SlotCalculator::SlotsForDate(LoadSnapshot(*repository_, *tx, provider_id, candidate_date, candidate_date), candidate_date, duration);
      locks   = repository_->ListSlotLocks(*tx, provider_id, date_key);
      tx->Commit();
    }
    ApplyLeadTime(slots, offset, now);

    for (const auto& slot : slots) {
      if (!slot.available) {
        continue;
      }
      if (day == 0 && model::Overlaps(slot.start_minute, slot.end_minute, start_minute, end_minute)) {
        continue;
      }
      const bool locked = std::any_of(locks.begin(), locks.end(), [&](const db::model::SlotLockRecord& lock) {
        return lock.locked_until_ms > now_ms && model::Overlaps(lock.start_minute, lock.end_minute, slot.start_minute, slot.end_minute);
      });
      if (locked) {
        continue;
      }
      out.push_back(slot);
      if (out.size() >= options_.alternative_count) {
        break;
      }
    }
  }
  return out;
}

void AvailabilityService::Invalidate(const std::string& provider_id, util::Date date) {
  const auto date_key = util::FormatDate(date);
  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InvalidateCachedSlots(*tx, provider_id, date_key), "invalidate availability cache");
    tx->Commit();
  } catch (const std::exception& e) {
    // Entries expire on their own; a missed invalidation only delays freshness.
    BOOKING_LOG_WARN("availability cache invalidation failed",
                     {observability::StringField("provider_id", provider_id), observability::StringField("date", date_key),
                      observability::StringField("error", e.what())});
  }
}

uint64_t AvailabilityService::PurgeExpiredCache(util::TimePoint now) {
  uint64_t deleted = 0;
  db::RetryOnCommitConflict(3, [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteExpiredCachedSlots(*tx, util::ToUnixMillis(now), deleted), "purge availability cache");
    tx->Commit();
  });
  return deleted;
}

} // namespace booking::availability
