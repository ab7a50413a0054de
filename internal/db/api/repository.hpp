#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/availability_cache_record.hpp"
#include "internal/db/model/availability_window_record.hpp"
#include "internal/db/model/blocked_slot_record.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/payout_record.hpp"
#include "internal/db/model/provider_record.hpp"
#include "internal/db/model/slot_lock_record.hpp"
#include "internal/db/model/transition_record.hpp"

namespace booking::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - InsertBooking rejects an overlapping slot-occupying booking for the
    same provider and date with ConstraintViolation, whatever the caller
    checked beforehand
  - UpdateBooking applies only when the stored version matches
  - ClaimDuePayouts never hands the same payout to two transactions

  The DB is the source of truth for:
    bookings and their transitions
    payouts
    slot locks (shared by every process)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Providers and schedules
  // ---------------------------------------------------------------------

  virtual Result UpsertProvider(Transaction&, const model::ProviderRecord&) = 0;

  virtual std::optional<model::ProviderRecord> GetProvider(Transaction&, const std::string& id) = 0;

  // Deactivates the provider's current windows and inserts the new set.
  virtual Result ReplaceAvailabilityWindows(Transaction&, const std::string& provider_id,
                                            const std::vector<model::AvailabilityWindowRecord>& windows) = 0;

  virtual std::vector<model::AvailabilityWindowRecord> ListAvailabilityWindows(Transaction&, const std::string& provider_id) = 0;

  virtual Result InsertBlockedSlot(Transaction&, const model::BlockedSlotRecord&) = 0;

  virtual Result DeleteBlockedSlot(Transaction&, const std::string& provider_id, const std::string& id) = 0;

  // Inclusive date range.
  virtual std::vector<model::BlockedSlotRecord> ListBlockedSlots(Transaction&, const std::string& provider_id, const DateRange& range) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  // Serializes booking writers for one provider/date until the transaction ends.
  virtual Result LockProviderDate(Transaction&, const std::string& provider_id, const std::string& date) = 0;

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::BookingRecord> GetBookingByConfirmationCode(Transaction&, const std::string& code) = 0;

  // Bookings whose status holds the slot, ordered by date then start.
  virtual std::vector<model::BookingRecord> ListOccupyingBookings(Transaction&, const std::string& provider_id, const DateRange& range) = 0;

  // Writes the record when the stored version equals expected_version; Conflict otherwise.
  virtual Result UpdateBooking(Transaction&, const model::BookingRecord&, uint64_t expected_version) = 0;

  virtual Result InsertTransition(Transaction&, const model::TransitionRecord&) = 0;

  virtual std::vector<model::TransitionRecord> ListTransitions(Transaction&, const std::string& booking_id) = 0;

  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& booking_id) = 0;

  // ---------------------------------------------------------------------
  // Slot locks
  // ---------------------------------------------------------------------

  virtual Result UpsertSlotLock(Transaction&, const model::SlotLockRecord&) = 0;

  virtual std::optional<model::SlotLockRecord> GetSlotLock(Transaction&, const std::string& lock_id) = 0;

  // Every lock for the provider/date, expired ones included.
  virtual std::vector<model::SlotLockRecord> ListSlotLocks(Transaction&, const std::string& provider_id, const std::string& date) = 0;

  virtual Result DeleteSlotLock(Transaction&, const std::string& lock_id) = 0;

  virtual Result DeleteExpiredSlotLocks(Transaction&, uint64_t now_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Availability cache
  // ---------------------------------------------------------------------

  virtual Result ReplaceCachedSlots(Transaction&, const std::string& provider_id, const std::string& date, uint32_t duration_minutes,
                                    const std::vector<model::AvailabilityCacheRecord>& slots) = 0;

  // Unexpired rows of the given slot length.
  virtual std::vector<model::AvailabilityCacheRecord> GetCachedSlots(Transaction&, const std::string& provider_id, const std::string& date,
                                                                     uint32_t duration_minutes, uint64_t now_ms) = 0;

  virtual Result InvalidateCachedSlots(Transaction&, const std::string& provider_id, const std::string& date) = 0;

  virtual Result DeleteExpiredCachedSlots(Transaction&, uint64_t now_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Payouts
  // ---------------------------------------------------------------------

  // AlreadyExists when the booking already has a payout.
  virtual Result InsertPayout(Transaction&, const model::PayoutRecord&) = 0;

  virtual std::optional<model::PayoutRecord> GetPayout(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::PayoutRecord> GetPayoutByBooking(Transaction&, const std::string& booking_id) = 0;

  virtual Result UpdatePayout(Transaction&, const model::PayoutRecord&) = 0;

  // Flips up to `limit` SCHEDULED payouts due at now_ms to PROCESSING and returns them.
  virtual std::vector<model::PayoutRecord> ClaimDuePayouts(Transaction&, uint64_t now_ms, uint32_t limit) = 0;

  virtual std::vector<model::PayoutRecord> ListPayouts(Transaction&, const PayoutFilter& filter) = 0;
};

} // namespace booking::db
