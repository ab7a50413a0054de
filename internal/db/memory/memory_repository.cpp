#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/time_slot.hpp"
#include "memory_tx.hpp"

namespace booking::db::memory {

using booking::model::BookingStatus;
using booking::model::OccupiesSlot;
using booking::model::Overlaps;
using booking::model::PayoutStatus;

namespace {

bool InRange(const std::string& date, const DateRange& range) {
  return date >= range.from && date <= range.to;
}

template <typename T>
std::vector<T> Paginate(std::vector<T> rows, const Pagination& page) {
  if (page.offset >= rows.size()) {
    return {};
  }
  auto begin = rows.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto end   = rows.end();
  if (page.limit > 0 && static_cast<std::size_t>(end - begin) > page.limit) {
    end = begin + static_cast<std::ptrdiff_t>(page.limit);
  }
  return std::vector<T>(begin, end);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Providers and schedules
// ------------------------------------------------------------------

Result MemoryRepository::UpsertProvider(Transaction& t, const model::ProviderRecord& r) {
  auto& s = TX(t).Mutable();
  auto  it = s.providers.find(r.id);
  if (it != s.providers.end()) {
    auto updated          = r;
    updated.created_at_ms = it->second.created_at_ms;
    it->second            = updated;
    return Result::Ok();
  }
  s.providers[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProviderRecord> MemoryRepository::GetProvider(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.providers.find(id);
  if (it == s.providers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::ReplaceAvailabilityWindows(Transaction& t, const std::string& provider_id,
                                                    const std::vector<model::AvailabilityWindowRecord>& windows) {
  auto& s = TX(t).Mutable();
  if (!s.providers.contains(provider_id)) return Result::Err(ErrorCode::NotFound, "provider " + provider_id);

  for (auto& w : s.windows) {
    if (w.provider_id == provider_id) w.active = false;
  }
  for (const auto& w : windows) {
    s.windows.push_back(w);
  }
  return Result::Ok();
}

std::vector<model::AvailabilityWindowRecord> MemoryRepository::ListAvailabilityWindows(Transaction& t, const std::string& provider_id) {
  std::vector<model::AvailabilityWindowRecord> out;
  for (const auto& w : TX(t).View().windows)
    if (w.provider_id == provider_id && w.active) out.push_back(w);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.day_of_week, a.start_minute, a.end_minute) < std::tie(b.day_of_week, b.start_minute, b.end_minute);
  });
  return out;
}

Result MemoryRepository::InsertBlockedSlot(Transaction& t, const model::BlockedSlotRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.providers.contains(r.provider_id)) return Result::Err(ErrorCode::NotFound, "provider " + r.provider_id);
  s.blocks.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::DeleteBlockedSlot(Transaction& t, const std::string& provider_id, const std::string& id) {
  auto&      s      = TX(t).Mutable();
  const auto before = s.blocks.size();
  std::erase_if(s.blocks, [&](const auto& b) { return b.provider_id == provider_id && b.id == id; });
  if (s.blocks.size() == before) return Result::Err(ErrorCode::NotFound, "blocked slot " + id);
  return Result::Ok();
}

std::vector<model::BlockedSlotRecord> MemoryRepository::ListBlockedSlots(Transaction& t, const std::string& provider_id,
                                                                         const DateRange& range) {
  std::vector<model::BlockedSlotRecord> out;
  for (const auto& b : TX(t).View().blocks)
    if (b.provider_id == provider_id && InRange(b.date, range)) out.push_back(b);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.date, a.start_minute) < std::tie(b.date, b.start_minute); });
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result MemoryRepository::LockProviderDate(Transaction& t, const std::string&, const std::string&) {
  // Any write makes concurrent writers fail at commit, which serializes them.
  TX(t).Mutable();
  return Result::Ok();
}

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.bookings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id);

  for (const auto& [_, existing] : s.bookings) {
    if (existing.confirmation_code == r.confirmation_code) {
      return Result::Err(ErrorCode::AlreadyExists, "confirmation code " + r.confirmation_code);
    }
    if (OccupiesSlot(r.status) && existing.provider_id == r.provider_id && existing.date == r.date && OccupiesSlot(existing.status) &&
        Overlaps(r.start_minute, r.end_minute, existing.start_minute, existing.end_minute)) {
      return Result::Err(ErrorCode::ConstraintViolation, "booking overlaps " + existing.id);
    }
  }

  s.bookings[r.id] = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bookings.find(id);
  if (it == s.bookings.end()) return std::nullopt;
  return it->second;
}

std::optional<model::BookingRecord> MemoryRepository::GetBookingByConfirmationCode(Transaction& t, const std::string& code) {
  for (const auto& [_, b] : TX(t).View().bookings)
    if (b.confirmation_code == code) return b;
  return std::nullopt;
}

std::vector<model::BookingRecord> MemoryRepository::ListOccupyingBookings(Transaction& t, const std::string& provider_id,
                                                                         const DateRange& range) {
  std::vector<model::BookingRecord> out;
  for (const auto& [_, b] : TX(t).View().bookings)
    if (b.provider_id == provider_id && InRange(b.date, range) && OccupiesSlot(b.status)) out.push_back(b);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.date, a.start_minute) < std::tie(b.date, b.start_minute); });
  return out;
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.bookings.find(r.id);
  if (it == s.bookings.end()) return Result::Err(ErrorCode::NotFound, "booking " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "booking " + r.id + " was modified concurrently");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::InsertTransition(Transaction& t, const model::TransitionRecord& r) {
  TX(t).Mutable().transitions.push_back(r);
  return Result::Ok();
}

std::vector<model::TransitionRecord> MemoryRepository::ListTransitions(Transaction& t, const std::string& booking_id) {
  std::vector<model::TransitionRecord> out;
  for (const auto& e : TX(t).View().transitions)
    if (e.booking_id == booking_id) out.push_back(e);
  return out;
}

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  TX(t).Mutable().ledger.push_back(r);
  return Result::Ok();
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListLedgerEntries(Transaction& t, const std::string& booking_id) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.booking_id == booking_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Slot locks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  TX(t).Mutable().slot_locks[r.lock_id] = r;
  return Result::Ok();
}

std::optional<model::SlotLockRecord> MemoryRepository::GetSlotLock(Transaction& t, const std::string& lock_id) {
  const auto& s  = TX(t).View();
  auto        it = s.slot_locks.find(lock_id);
  if (it == s.slot_locks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SlotLockRecord> MemoryRepository::ListSlotLocks(Transaction& t, const std::string& provider_id, const std::string& date) {
  std::vector<model::SlotLockRecord> out;
  for (const auto& [_, l] : TX(t).View().slot_locks)
    if (l.provider_id == provider_id && l.date == date) out.push_back(l);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.start_minute < b.start_minute; });
  return out;
}

Result MemoryRepository::DeleteSlotLock(Transaction& t, const std::string& lock_id) {
  TX(t).Mutable().slot_locks.erase(lock_id);
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredSlotLocks(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  deleted = std::erase_if(TX(t).Mutable().slot_locks, [now_ms](const auto& entry) { return entry.second.locked_until_ms <= now_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Availability cache
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date, uint32_t duration_minutes,
                                            const std::vector<model::AvailabilityCacheRecord>& slots) {
  TX(t).Mutable().cache[CacheKey{provider_id, date, duration_minutes}] = slots;
  return Result::Ok();
}

std::vector<model::AvailabilityCacheRecord> MemoryRepository::GetCachedSlots(Transaction& t, const std::string& provider_id,
                                                                             const std::string& date, uint32_t duration_minutes,
                                                                             uint64_t now_ms) {
  const auto& s  = TX(t).View();
  auto        it = s.cache.find(CacheKey{provider_id, date, duration_minutes});
  if (it == s.cache.end()) return {};

  std::vector<model::AvailabilityCacheRecord> out;
  for (const auto& row : it->second)
    if (row.expires_at_ms > now_ms) out.push_back(row);
  return out;
}

Result MemoryRepository::InvalidateCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date) {
  auto& cache = TX(t).Mutable().cache;
  for (auto it = cache.lower_bound(CacheKey{provider_id, date, 0}); it != cache.end();) {
    if (std::get<0>(it->first) != provider_id || std::get<1>(it->first) != date) break;
    it = cache.erase(it);
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredCachedSlots(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  deleted = 0;
  for (auto& [_, rows] : TX(t).Mutable().cache) {
    deleted += std::erase_if(rows, [now_ms](const auto& row) { return row.expires_at_ms <= now_ms; });
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payouts
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayout(Transaction& t, const model::PayoutRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.payouts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "payout " + r.id);
  for (const auto& [_, p] : s.payouts) {
    if (p.booking_id == r.booking_id) return Result::Err(ErrorCode::AlreadyExists, "payout for booking " + r.booking_id);
  }
  s.payouts[r.id] = r;
  return Result::Ok();
}

std::optional<model::PayoutRecord> MemoryRepository::GetPayout(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.payouts.find(id);
  if (it == s.payouts.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PayoutRecord> MemoryRepository::GetPayoutByBooking(Transaction& t, const std::string& booking_id) {
  for (const auto& [_, p] : TX(t).View().payouts)
    if (p.booking_id == booking_id) return p;
  return std::nullopt;
}

Result MemoryRepository::UpdatePayout(Transaction& t, const model::PayoutRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.payouts.find(r.id);
  if (it == s.payouts.end()) return Result::Err(ErrorCode::NotFound, "payout " + r.id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::PayoutRecord> MemoryRepository::ClaimDuePayouts(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto& tx      = TX(t);
  bool  any_due = false;
  for (const auto& [_, p] : tx.View().payouts)
    if (p.status == PayoutStatus::kScheduled && p.scheduled_at_ms <= now_ms) any_due = true;
  // An empty claim stays read-only so idle passes never conflict.
  if (!any_due || limit == 0) return {};

  auto&                             s = tx.Mutable();
  std::vector<model::PayoutRecord*> due;
  for (auto& [_, p] : s.payouts)
    if (p.status == PayoutStatus::kScheduled && p.scheduled_at_ms <= now_ms) due.push_back(&p);
  std::sort(due.begin(), due.end(), [](const auto* a, const auto* b) { return a->scheduled_at_ms < b->scheduled_at_ms; });
  if (due.size() > limit) due.resize(limit);

  std::vector<model::PayoutRecord> claimed;
  claimed.reserve(due.size());
  for (auto* p : due) {
    p->status        = PayoutStatus::kProcessing;
    p->updated_at_ms = now_ms;
    claimed.push_back(*p);
  }
  return claimed;
}

std::vector<model::PayoutRecord> MemoryRepository::ListPayouts(Transaction& t, const PayoutFilter& filter) {
  std::vector<model::PayoutRecord> rows;
  for (const auto& [_, p] : TX(t).View().payouts) {
    if (!filter.provider_id.empty() && p.provider_id != filter.provider_id) continue;
    if (!filter.statuses.empty() && std::find(filter.statuses.begin(), filter.statuses.end(), p.status) == filter.statuses.end()) continue;
    rows.push_back(p);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return std::tie(b.scheduled_at_ms, b.id) < std::tie(a.scheduled_at_ms, a.id);
  });
  return Paginate(std::move(rows), filter.page);
}

} // namespace booking::db::memory
