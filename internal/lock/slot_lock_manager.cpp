#include "slot_lock_manager.hpp"

#include <stdexcept>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace booking::lock {

namespace {

constexpr uint32_t kMaxCommitAttempts = 5;

AcquireResult Contested(std::string reason) {
  AcquireResult result;
  result.acquired = false;
  result.reason   = std::move(reason);
  return result;
}

} // namespace

SlotLockManager::SlotLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<availability::AvailabilityService> availability,
                                 SlotLockOptions options)
    : repository_(std::move(repository)), availability_(std::move(availability)), options_(options) {
  if (!repository_ || !availability_) {
    throw std::invalid_argument("SlotLockManager requires a repository and an availability service");
  }
}

AcquireResult SlotLockManager::Acquire(const std::string& provider_id, util::Date date, uint32_t start_minute, uint32_t end_minute,
                                       const std::string& session_id, std::optional<std::chrono::milliseconds> ttl, util::TimePoint now) {
  if (provider_id.empty() || session_id.empty()) {
    throw util::ValidationError("provider_id and session_id are required");
  }
  if (start_minute >= end_minute || end_minute > model::kMinutesPerDay) {
    throw util::ValidationError("invalid slot interval");
  }
  const auto lock_ttl = ttl.value_or(options_.default_ttl);
  if (lock_ttl.count() <= 0) {
    throw util::ValidationError("lock ttl must be positive");
  }
  if (options_.max_ttl.count() > 0 && lock_ttl > options_.max_ttl) {
    throw util::ValidationError("lock ttl exceeds the maximum of " + std::to_string(options_.max_ttl.count() / 1000) + "s");
  }

  const auto date_key = util::FormatDate(date);
  const auto now_ms   = util::ToUnixMillis(now);

  AcquireResult result;
  bool          offered = false;
  for (const auto& slot : availability_->CachedSlotsForDate(provider_id, date, end_minute - start_minute, now)) {
    if (slot.start_minute == start_minute && slot.end_minute == end_minute && slot.available) {
      offered = true;
      break;
    }
  }

  if (!offered) {
    result = Contested("slot is not available");
  } else {
    result = db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->LockProviderDate(*tx, provider_id, date_key), "lock provider date");

      std::string reuse_id;
      for (const auto& existing : repository_->ListSlotLocks(*tx, provider_id, date_key)) {
        if (existing.locked_until_ms <= now_ms ||
            !model::Overlaps(existing.start_minute, existing.end_minute, start_minute, end_minute)) {
          continue;
        }
        if (existing.session_id != session_id) {
          return Contested("slot is locked by another session");
        }
        if (existing.start_minute == start_minute && existing.end_minute == end_minute) {
          reuse_id = existing.lock_id;
        }
      }

      db::model::SlotLockRecord record;
      record.lock_id         = reuse_id.empty() ? util::NewId() : reuse_id;
      record.provider_id     = provider_id;
      record.date            = date_key;
      record.start_minute    = start_minute;
      record.end_minute      = end_minute;
      record.session_id      = session_id;
      record.locked_until_ms = now_ms + static_cast<uint64_t>(lock_ttl.count());
      record.created_at_ms   = now_ms;

      db::ThrowIfDbError(repository_->UpsertSlotLock(*tx, record), "upsert slot lock");
      db::ThrowIfDbError(repository_->InvalidateCachedSlots(*tx, provider_id, date_key), "invalidate availability cache");
      tx->Commit();

      AcquireResult acquired;
      acquired.acquired = true;
      acquired.lock     = record;
      return acquired;
    });
  }

  if (!result.acquired) {
    result.alternatives = availability_->FindAlternatives(provider_id, date, start_minute, end_minute, now);
    observability::Metrics::Instance().RecordSlotLockAttempt("contested");
    BOOKING_LOG_INFO("slot lock contested", {observability::StringField("provider_id", provider_id), observability::StringField("date", date_key),
                                             observability::IntField("start_minute", start_minute), observability::StringField("reason", result.reason)});
    return result;
  }

  observability::Metrics::Instance().RecordSlotLockAttempt("acquired");
  BOOKING_LOG_DEBUG("slot lock acquired", {observability::StringField("lock_id", result.lock->lock_id),
                                           observability::StringField("provider_id", provider_id), observability::StringField("date", date_key)});
  return result;
}

bool SlotLockManager::Release(const std::string& lock_id) {
  if (lock_id.empty()) {
    return false;
  }

  return db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetSlotLock(*tx, lock_id);
    if (!existing) {
      tx->Commit();
      return false;
    }
    db::ThrowIfDbError(repository_->DeleteSlotLock(*tx, lock_id), "delete slot lock");
    db::ThrowIfDbError(repository_->InvalidateCachedSlots(*tx, existing->provider_id, existing->date), "invalidate availability cache");
    tx->Commit();
    return true;
  });
}

std::optional<db::model::SlotLockRecord> SlotLockManager::Get(const std::string& lock_id) {
  auto tx   = repository_->Begin();
  auto lock = repository_->GetSlotLock(*tx, lock_id);
  tx->Commit();
  return lock;
}

SweepStats SlotLockManager::Sweep(util::TimePoint now) {
  SweepStats stats;
  db::RetryOnCommitConflict(kMaxCommitAttempts, [&] {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->DeleteExpiredSlotLocks(*tx, util::ToUnixMillis(now), stats.locks_deleted), "sweep slot locks");
    tx->Commit();
  });
  stats.cache_rows_deleted = availability_->PurgeExpiredCache(now);

  if (stats.locks_deleted > 0 || stats.cache_rows_deleted > 0) {
    BOOKING_LOG_INFO("slot lock sweep", {observability::IntField("locks_deleted", static_cast<int64_t>(stats.locks_deleted)),
                                         observability::IntField("cache_rows_deleted", static_cast<int64_t>(stats.cache_rows_deleted))});
  }
  return stats;
}

} // namespace booking::lock
