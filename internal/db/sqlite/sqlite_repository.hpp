#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace booking::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertProvider(Transaction&, const model::ProviderRecord&) override;
  std::optional<model::ProviderRecord> GetProvider(Transaction&, const std::string&) override;
  Result ReplaceAvailabilityWindows(Transaction&, const std::string& provider_id,
                                    const std::vector<model::AvailabilityWindowRecord>& windows) override;
  std::vector<model::AvailabilityWindowRecord> ListAvailabilityWindows(Transaction&, const std::string& provider_id) override;
  Result InsertBlockedSlot(Transaction&, const model::BlockedSlotRecord&) override;
  Result DeleteBlockedSlot(Transaction&, const std::string& provider_id, const std::string& id) override;
  std::vector<model::BlockedSlotRecord> ListBlockedSlots(Transaction&, const std::string& provider_id, const DateRange& range) override;

  Result LockProviderDate(Transaction&, const std::string& provider_id, const std::string& date) override;
  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  std::optional<model::BookingRecord> GetBookingByConfirmationCode(Transaction&, const std::string&) override;
  std::vector<model::BookingRecord> ListOccupyingBookings(Transaction&, const std::string& provider_id, const DateRange& range) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&, uint64_t expected_version) override;
  Result InsertTransition(Transaction&, const model::TransitionRecord&) override;
  std::vector<model::TransitionRecord> ListTransitions(Transaction&, const std::string& booking_id) override;
  Result InsertLedgerEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::vector<model::LedgerEntryRecord> ListLedgerEntries(Transaction&, const std::string& booking_id) override;

  Result UpsertSlotLock(Transaction&, const model::SlotLockRecord&) override;
  std::optional<model::SlotLockRecord> GetSlotLock(Transaction&, const std::string&) override;
  std::vector<model::SlotLockRecord> ListSlotLocks(Transaction&, const std::string& provider_id, const std::string& date) override;
  Result DeleteSlotLock(Transaction&, const std::string&) override;
  Result DeleteExpiredSlotLocks(Transaction&, uint64_t now_ms, uint64_t& deleted) override;

  Result ReplaceCachedSlots(Transaction&, const std::string& provider_id, const std::string& date, uint32_t duration_minutes,
                            const std::vector<model::AvailabilityCacheRecord>& slots) override;
  std::vector<model::AvailabilityCacheRecord> GetCachedSlots(Transaction&, const std::string& provider_id, const std::string& date,
                                                             uint32_t duration_minutes, uint64_t now_ms) override;
  Result InvalidateCachedSlots(Transaction&, const std::string& provider_id, const std::string& date) override;
  Result DeleteExpiredCachedSlots(Transaction&, uint64_t now_ms, uint64_t& deleted) override;

  Result InsertPayout(Transaction&, const model::PayoutRecord&) override;
  std::optional<model::PayoutRecord> GetPayout(Transaction&, const std::string&) override;
  std::optional<model::PayoutRecord> GetPayoutByBooking(Transaction&, const std::string&) override;
  Result UpdatePayout(Transaction&, const model::PayoutRecord&) override;
  std::vector<model::PayoutRecord> ClaimDuePayouts(Transaction&, uint64_t now_ms, uint32_t limit) override;
  std::vector<model::PayoutRecord> ListPayouts(Transaction&, const PayoutFilter& filter) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
