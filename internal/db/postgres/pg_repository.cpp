#include "pg_repository.hpp"

#include <algorithm>
#include <stdexcept>

namespace booking::db::postgres {

namespace {

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::string StatusText(booking::model::BookingStatus s) {
  return std::string(booking::model::ToString(s));
}

std::string StatusText(booking::model::PayoutStatus s) {
  return std::string(booking::model::ToString(s));
}

booking::model::BookingStatus BookingStatusOf(const pqxx::field& f) {
  auto status = booking::model::ParseBookingStatus(f.c_str());
  if (!status) throw std::runtime_error(std::string("unknown booking status in store: ") + f.c_str());
  return *status;
}

booking::model::PayoutStatus PayoutStatusOf(const pqxx::field& f) {
  auto status = booking::model::ParsePayoutStatus(f.c_str());
  if (!status) throw std::runtime_error(std::string("unknown payout status in store: ") + f.c_str());
  return *status;
}

model::BookingRecord ReadBooking(const pqxx::row& row) {
  model::BookingRecord r;
  r.id                     = row[0].c_str();
  r.provider_id            = row[1].c_str();
  r.customer_id            = Text(row[2]);
  r.guest_email            = Text(row[3]);
  r.date                   = row[4].c_str();
  r.start_minute           = row[5].as<uint32_t>();
  r.end_minute             = row[6].as<uint32_t>();
  r.status                 = BookingStatusOf(row[7]);
  r.total_cents            = row[8].as<int64_t>();
  r.platform_fee_cents     = row[9].as<int64_t>();
  r.provider_payout_cents  = row[10].as<int64_t>();
  r.currency               = row[11].c_str();
  r.confirmation_code      = row[12].c_str();
  r.cancelled_at_ms        = row[13].as<uint64_t>();
  r.cancelled_by           = Text(row[14]);
  r.cancellation_reason    = Text(row[15]);
  r.cancellation_fee_cents = row[16].as<int64_t>();
  r.created_at_ms          = row[17].as<uint64_t>();
  r.updated_at_ms          = row[18].as<uint64_t>();
  r.version                = row[19].as<uint64_t>();
  return r;
}

model::PayoutRecord ReadPayout(const pqxx::row& row) {
  model::PayoutRecord r;
  r.id                   = row[0].c_str();
  r.booking_id           = row[1].c_str();
  r.provider_id          = row[2].c_str();
  r.amount_cents         = row[3].as<int64_t>();
  r.currency             = row[4].c_str();
  r.status               = PayoutStatusOf(row[5]);
  r.scheduled_at_ms      = row[6].as<uint64_t>();
  r.retry_count          = row[7].as<uint32_t>();
  r.external_transfer_id = Text(row[8]);
  r.failure_reason       = Text(row[9]);
  r.processed_at_ms      = row[10].as<uint64_t>();
  r.created_at_ms        = row[11].as<uint64_t>();
  r.updated_at_ms        = row[12].as<uint64_t>();
  return r;
}

model::SlotLockRecord ReadSlotLock(const pqxx::row& row) {
  model::SlotLockRecord r;
  r.lock_id         = row[0].c_str();
  r.provider_id     = row[1].c_str();
  r.date            = row[2].c_str();
  r.start_minute    = row[3].as<uint32_t>();
  r.end_minute      = row[4].as<uint32_t>();
  r.session_id      = row[5].c_str();
  r.locked_until_ms = row[6].as<uint64_t>();
  r.created_at_ms   = row[7].as<uint64_t>();
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> Collect(const pqxx::result& res, Reader read) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql->sqlstate();
    if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
    if (state == "23P01" || state == "23503" || state == "23514") return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "40001" || state == "40P01") return Result::Err(ErrorCode::SerializationFailure, e.what());
    if (state == "55P03") return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::StorageError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Providers and schedules
// ------------------------------------------------------------------

Result PgRepository::UpsertProvider(Transaction& t, const model::ProviderRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO providers(id,display_name,utc_offset_minutes,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(id) DO UPDATE SET display_name=EXCLUDED.display_name, utc_offset_minutes=EXCLUDED.utc_offset_minutes, "
        "updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.display_name, r.utc_offset_minutes, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProviderRecord> PgRepository::GetProvider(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT id,display_name,utc_offset_minutes,created_at_ms,updated_at_ms FROM providers WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  model::ProviderRecord r;
  r.id                 = res[0][0].c_str();
  r.display_name       = res[0][1].c_str();
  r.utc_offset_minutes = res[0][2].as<int32_t>();
  r.created_at_ms      = res[0][3].as<uint64_t>();
  r.updated_at_ms      = res[0][4].as<uint64_t>();
  return r;
}

Result PgRepository::ReplaceAvailabilityWindows(Transaction& t, const std::string& provider_id,
                                                const std::vector<model::AvailabilityWindowRecord>& windows) {
  try {
    auto& work = TX(t).Work();
    work.exec_params("UPDATE availability_windows SET active=FALSE WHERE provider_id=$1 AND active;", provider_id);
    for (const auto& w : windows) {
      work.exec_params("INSERT INTO availability_windows(id,provider_id,day_of_week,start_minute,end_minute,active) VALUES($1,$2,$3,$4,$5,$6);",
                       w.id, provider_id, w.day_of_week, w.start_minute, w.end_minute, w.active);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AvailabilityWindowRecord> PgRepository::ListAvailabilityWindows(Transaction& t, const std::string& provider_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,provider_id,day_of_week,start_minute,end_minute,active FROM availability_windows "
      "WHERE provider_id=$1 AND active ORDER BY day_of_week, start_minute;",
      provider_id);

  return Collect<model::AvailabilityWindowRecord>(res, [](const pqxx::row& row) {
    model::AvailabilityWindowRecord w;
    w.id           = row[0].c_str();
    w.provider_id  = row[1].c_str();
    w.day_of_week  = row[2].as<uint32_t>();
    w.start_minute = row[3].as<uint32_t>();
    w.end_minute   = row[4].as<uint32_t>();
    w.active       = row[5].as<bool>();
    return w;
  });
}

Result PgRepository::InsertBlockedSlot(Transaction& t, const model::BlockedSlotRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO blocked_slots(id,provider_id,date,full_day,start_minute,end_minute,reason,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
        r.id, r.provider_id, r.date, r.full_day, r.start_minute, r.end_minute, Nullable(r.reason), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBlockedSlot(Transaction& t, const std::string& provider_id, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM blocked_slots WHERE id=$1 AND provider_id=$2;", id, provider_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "blocked slot not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BlockedSlotRecord> PgRepository::ListBlockedSlots(Transaction& t, const std::string& provider_id, const DateRange& range) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,provider_id,date,full_day,start_minute,end_minute,reason,created_at_ms FROM blocked_slots "
      "WHERE provider_id=$1 AND date BETWEEN $2 AND $3 ORDER BY date, start_minute;",
      provider_id, range.from, range.to);

  return Collect<model::BlockedSlotRecord>(res, [](const pqxx::row& row) {
    model::BlockedSlotRecord b;
    b.id            = row[0].c_str();
    b.provider_id   = row[1].c_str();
    b.date          = row[2].c_str();
    b.full_day      = row[3].as<bool>();
    b.start_minute  = row[4].as<uint32_t>();
    b.end_minute    = row[5].as<uint32_t>();
    b.reason        = Text(row[6]);
    b.created_at_ms = row[7].as<uint64_t>();
    return b;
  });
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result PgRepository::LockProviderDate(Transaction& t, const std::string& provider_id, const std::string& date) {
  try {
    TX(t).Work().exec_prepared("lock_provider_date", provider_id, date);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_booking", r.id, r.provider_id, Nullable(r.customer_id), Nullable(r.guest_email), r.date, r.start_minute,
                               r.end_minute, StatusText(r.status), r.total_cents, r.platform_fee_cents, r.provider_payout_cents, r.currency,
                               r.confirmation_code, r.cancelled_at_ms, Nullable(r.cancelled_by), Nullable(r.cancellation_reason),
                               r.cancellation_fee_cents, r.created_at_ms, r.updated_at_ms, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BookingRecord> PgRepository::GetBooking(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_booking", id);
  if (res.empty()) return std::nullopt;
  return ReadBooking(res[0]);
}

std::optional<model::BookingRecord> PgRepository::GetBookingByConfirmationCode(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_prepared("get_booking_by_code", code);
  if (res.empty()) return std::nullopt;
  return ReadBooking(res[0]);
}

std::vector<model::BookingRecord> PgRepository::ListOccupyingBookings(Transaction& t, const std::string& provider_id, const DateRange& range) {
  auto res = TX(t).Work().exec_prepared("list_occupying_bookings", provider_id, range.from, range.to);
  return Collect<model::BookingRecord>(res, ReadBooking);
}

Result PgRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_booking", r.id, r.date, r.start_minute, r.end_minute, StatusText(r.status), r.total_cents,
                                          r.platform_fee_cents, r.provider_payout_cents, r.cancelled_at_ms, Nullable(r.cancelled_by),
                                          Nullable(r.cancellation_reason), r.cancellation_fee_cents, r.updated_at_ms, r.version,
                                          expected_version);
    if (res.affected_rows() == 0) {
      if (!GetBooking(t, r.id)) return Result::Err(ErrorCode::NotFound, "booking not found: " + r.id);
      return Result::Err(ErrorCode::Conflict, "booking version changed: " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertTransition(Transaction& t, const model::TransitionRecord& r) {
  try {
    std::optional<std::string> from;
    if (r.from_status) from = StatusText(*r.from_status);
    TX(t).Work().exec_params(
        "INSERT INTO booking_transitions(id,booking_id,from_status,to_status,triggered_by,reason,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7);",
        r.id, r.booking_id, from, StatusText(r.to_status), Nullable(r.triggered_by), Nullable(r.reason), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TransitionRecord> PgRepository::ListTransitions(Transaction& t, const std::string& booking_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,booking_id,from_status,to_status,triggered_by,reason,created_at_ms FROM booking_transitions "
      "WHERE booking_id=$1 ORDER BY created_at_ms, seq;",
      booking_id);

  return Collect<model::TransitionRecord>(res, [](const pqxx::row& row) {
    model::TransitionRecord r;
    r.id         = row[0].c_str();
    r.booking_id = row[1].c_str();
    if (!row[2].is_null()) {
      r.from_status = BookingStatusOf(row[2]);
    }
    r.to_status     = BookingStatusOf(row[3]);
    r.triggered_by  = Text(row[4]);
    r.reason        = Text(row[5]);
    r.created_at_ms = row[6].as<uint64_t>();
    return r;
  });
}

Result PgRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO ledger_entries(id,booking_id,kind,amount_cents,currency,created_at_ms) VALUES($1,$2,$3,$4,$5,$6);",
                             r.id, r.booking_id, r.kind, r.amount_cents, r.currency, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerEntryRecord> PgRepository::ListLedgerEntries(Transaction& t, const std::string& booking_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,booking_id,kind,amount_cents,currency,created_at_ms FROM ledger_entries WHERE booking_id=$1 ORDER BY created_at_ms, id;",
      booking_id);

  return Collect<model::LedgerEntryRecord>(res, [](const pqxx::row& row) {
    model::LedgerEntryRecord r;
    r.id            = row[0].c_str();
    r.booking_id    = row[1].c_str();
    r.kind          = row[2].c_str();
    r.amount_cents  = row[3].as<int64_t>();
    r.currency      = row[4].c_str();
    r.created_at_ms = row[5].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Slot locks
// ------------------------------------------------------------------

Result PgRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_slot_lock", r.lock_id, r.provider_id, r.date, r.start_minute, r.end_minute, r.session_id,
                               r.locked_until_ms, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SlotLockRecord> PgRepository::GetSlotLock(Transaction& t, const std::string& lock_id) {
  auto res = TX(t).Work().exec_prepared("get_slot_lock", lock_id);
  if (res.empty()) return std::nullopt;
  return ReadSlotLock(res[0]);
}

std::vector<model::SlotLockRecord> PgRepository::ListSlotLocks(Transaction& t, const std::string& provider_id, const std::string& date) {
  auto res = TX(t).Work().exec_prepared("list_slot_locks", provider_id, date);
  return Collect<model::SlotLockRecord>(res, ReadSlotLock);
}

Result PgRepository::DeleteSlotLock(Transaction& t, const std::string& lock_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM slot_locks WHERE lock_id=$1;", lock_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "slot lock not found: " + lock_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredSlotLocks(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM slot_locks WHERE locked_until_ms <= $1;", now_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Availability cache
// ------------------------------------------------------------------

Result PgRepository::ReplaceCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date, uint32_t duration_minutes,
                                        const std::vector<model::AvailabilityCacheRecord>& slots) {
  try {
    auto& work = TX(t).Work();
    work.exec_params("DELETE FROM availability_cache WHERE provider_id=$1 AND date=$2 AND duration_minutes=$3;", provider_id, date,
                     duration_minutes);
    for (const auto& slot : slots) {
      work.exec_params(
          "INSERT INTO availability_cache(provider_id,date,duration_minutes,start_minute,end_minute,available,expires_at_ms) "
          "VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT DO NOTHING;",
          provider_id, date, duration_minutes, slot.start_minute, slot.end_minute, slot.available, slot.expires_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AvailabilityCacheRecord> PgRepository::GetCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date,
                                                                         uint32_t duration_minutes, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT provider_id,date,start_minute,end_minute,available,expires_at_ms FROM availability_cache "
      "WHERE provider_id=$1 AND date=$2 AND duration_minutes=$3 AND expires_at_ms > $4 ORDER BY start_minute;",
      provider_id, date, duration_minutes, now_ms);

  return Collect<model::AvailabilityCacheRecord>(res, [](const pqxx::row& row) {
    model::AvailabilityCacheRecord r;
    r.provider_id   = row[0].c_str();
    r.date          = row[1].c_str();
    r.start_minute  = row[2].as<uint32_t>();
    r.end_minute    = row[3].as<uint32_t>();
    r.available     = row[4].as<bool>();
    r.expires_at_ms = row[5].as<uint64_t>();
    return r;
  });
}

Result PgRepository::InvalidateCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date) {
  try {
    TX(t).Work().exec_params("DELETE FROM availability_cache WHERE provider_id=$1 AND date=$2;", provider_id, date);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredCachedSlots(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM availability_cache WHERE expires_at_ms <= $1;", now_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Payouts
// ------------------------------------------------------------------

Result PgRepository::InsertPayout(Transaction& t, const model::PayoutRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO payouts(id,booking_id,provider_id,amount_cents,currency,status,scheduled_at_ms,retry_count,external_transfer_id,"
        "failure_reason,processed_at_ms,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13);",
        r.id, r.booking_id, r.provider_id, r.amount_cents, r.currency, StatusText(r.status), r.scheduled_at_ms, r.retry_count,
        Nullable(r.external_transfer_id), Nullable(r.failure_reason), r.processed_at_ms, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PayoutRecord> PgRepository::GetPayout(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_payout", id);
  if (res.empty()) return std::nullopt;
  return ReadPayout(res[0]);
}

std::optional<model::PayoutRecord> PgRepository::GetPayoutByBooking(Transaction& t, const std::string& booking_id) {
  auto res = TX(t).Work().exec_prepared("get_payout_by_booking", booking_id);
  if (res.empty()) return std::nullopt;
  return ReadPayout(res[0]);
}

Result PgRepository::UpdatePayout(Transaction& t, const model::PayoutRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE payouts SET status=$2,scheduled_at_ms=$3,retry_count=$4,external_transfer_id=$5,failure_reason=$6,processed_at_ms=$7,"
        "updated_at_ms=$8 WHERE id=$1;",
        r.id, StatusText(r.status), r.scheduled_at_ms, r.retry_count, Nullable(r.external_transfer_id), Nullable(r.failure_reason),
        r.processed_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "payout not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// SKIP LOCKED lets concurrent schedulers claim disjoint batches.
std::vector<model::PayoutRecord> PgRepository::ClaimDuePayouts(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto res     = TX(t).Work().exec_prepared("claim_due_payouts", now_ms, limit);
  auto claimed = Collect<model::PayoutRecord>(res, ReadPayout);
  std::sort(claimed.begin(), claimed.end(),
            [](const model::PayoutRecord& a, const model::PayoutRecord& b) { return a.scheduled_at_ms < b.scheduled_at_ms; });
  return claimed;
}

std::vector<model::PayoutRecord> PgRepository::ListPayouts(Transaction& t, const PayoutFilter& filter) {
  // Statuses are fixed lowercase words, safe inside an array literal.
  std::string statuses = "{";
  for (size_t i = 0; i < filter.statuses.size(); ++i) {
    if (i > 0) statuses += ",";
    statuses += StatusText(filter.statuses[i]);
  }
  statuses += "}";

  std::optional<uint64_t> limit;
  if (filter.page.limit > 0) limit = filter.page.limit;

  auto res = TX(t).Work().exec_params(
      "SELECT id,booking_id,provider_id,amount_cents,currency,status,scheduled_at_ms,retry_count,external_transfer_id,"
      "failure_reason,processed_at_ms,created_at_ms,updated_at_ms FROM payouts "
      "WHERE ($1 = '' OR provider_id = $1) AND (cardinality($2::text[]) = 0 OR status = ANY($2::text[])) "
      "ORDER BY scheduled_at_ms DESC, id LIMIT $3 OFFSET $4;",
      filter.provider_id, statuses, limit, static_cast<uint64_t>(filter.page.offset));
  return Collect<model::PayoutRecord>(res, ReadPayout);
}

} // namespace booking::db::postgres
