#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace booking::db::sqlite {

using booking::db::ErrorCode;
using booking::db::Result;

namespace {

// Finalizes on scope exit so early returns never leak a statement.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

  // Reads cannot report a Result, so prepare failures surface as exceptions.
  void Require() const {
    if (!st_) {
      throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL in nullable columns.
void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

booking::model::BookingStatus ColBookingStatus(sqlite3_stmt* st, int col) {
  auto text   = ColText(st, col);
  auto status = booking::model::ParseBookingStatus(text);
  if (!status) {
    throw std::runtime_error("unknown booking status in store: " + text);
  }
  return *status;
}

booking::model::PayoutStatus ColPayoutStatus(sqlite3_stmt* st, int col) {
  auto text   = ColText(st, col);
  auto status = booking::model::ParsePayoutStatus(text);
  if (!status) {
    throw std::runtime_error("unknown payout status in store: " + text);
  }
  return *status;
}

std::string StatusText(booking::model::BookingStatus s) {
  return std::string(booking::model::ToString(s));
}

std::string StatusText(booking::model::PayoutStatus s) {
  return std::string(booking::model::ToString(s));
}

constexpr const char* kBookingColumns =
    "id,provider_id,customer_id,guest_email,date,start_minute,end_minute,status,total_cents,platform_fee_cents,"
    "provider_payout_cents,currency,confirmation_code,cancelled_at_ms,cancelled_by,cancellation_reason,"
    "cancellation_fee_cents,created_at_ms,updated_at_ms,version";

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id                     = ColText(st, 0);
  r.provider_id            = ColText(st, 1);
  r.customer_id            = ColText(st, 2);
  r.guest_email            = ColText(st, 3);
  r.date                   = ColText(st, 4);
  r.start_minute           = ColU32(st, 5);
  r.end_minute             = ColU32(st, 6);
  r.status                 = ColBookingStatus(st, 7);
  r.total_cents            = ColI64(st, 8);
  r.platform_fee_cents     = ColI64(st, 9);
  r.provider_payout_cents  = ColI64(st, 10);
  r.currency               = ColText(st, 11);
  r.confirmation_code      = ColText(st, 12);
  r.cancelled_at_ms        = ColU64(st, 13);
  r.cancelled_by           = ColText(st, 14);
  r.cancellation_reason    = ColText(st, 15);
  r.cancellation_fee_cents = ColI64(st, 16);
  r.created_at_ms          = ColU64(st, 17);
  r.updated_at_ms          = ColU64(st, 18);
  r.version                = ColU64(st, 19);
  return r;
}

constexpr const char* kPayoutColumns =
    "id,booking_id,provider_id,amount_cents,currency,status,scheduled_at_ms,retry_count,external_transfer_id,"
    "failure_reason,processed_at_ms,created_at_ms,updated_at_ms";

model::PayoutRecord ReadPayout(sqlite3_stmt* st) {
  model::PayoutRecord r;
  r.id                   = ColText(st, 0);
  r.booking_id           = ColText(st, 1);
  r.provider_id          = ColText(st, 2);
  r.amount_cents         = ColI64(st, 3);
  r.currency             = ColText(st, 4);
  r.status               = ColPayoutStatus(st, 5);
  r.scheduled_at_ms      = ColU64(st, 6);
  r.retry_count          = ColU32(st, 7);
  r.external_transfer_id = ColText(st, 8);
  r.failure_reason       = ColText(st, 9);
  r.processed_at_ms      = ColU64(st, 10);
  r.created_at_ms        = ColU64(st, 11);
  r.updated_at_ms        = ColU64(st, 12);
  return r;
}

model::SlotLockRecord ReadSlotLock(sqlite3_stmt* st) {
  model::SlotLockRecord r;
  r.lock_id         = ColText(st, 0);
  r.provider_id     = ColText(st, 1);
  r.date            = ColText(st, 2);
  r.start_minute    = ColU32(st, 3);
  r.end_minute      = ColU32(st, 4);
  r.session_id      = ColText(st, 5);
  r.locked_until_ms = ColU64(st, 6);
  r.created_at_ms   = ColU64(st, 7);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const int extended = sqlite3_extended_errcode(db);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::StorageError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Providers and schedules
// ------------------------------------------------------------------

Result SqliteRepository::UpsertProvider(Transaction& t, const model::ProviderRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO providers(id,display_name,utc_offset_minutes,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET display_name=excluded.display_name, utc_offset_minutes=excluded.utc_offset_minutes, "
               "updated_at_ms=excluded.updated_at_ms;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.display_name);
  BindI32(st.get(), 3, r.utc_offset_minutes);
  BindU64(st.get(), 4, r.created_at_ms);
  BindU64(st.get(), 5, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProviderRecord> SqliteRepository::GetProvider(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,display_name,utc_offset_minutes,created_at_ms,updated_at_ms FROM providers WHERE id=?;");
  st.Require();
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ProviderRecord r;
  r.id                 = ColText(st.get(), 0);
  r.display_name       = ColText(st.get(), 1);
  r.utc_offset_minutes = sqlite3_column_int(st.get(), 2);
  r.created_at_ms      = ColU64(st.get(), 3);
  r.updated_at_ms      = ColU64(st.get(), 4);
  return r;
}

Result SqliteRepository::ReplaceAvailabilityWindows(Transaction& t, const std::string& provider_id,
                                                    const std::vector<model::AvailabilityWindowRecord>& windows) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "UPDATE availability_windows SET active=0 WHERE provider_id=? AND active=1;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, provider_id);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  Statement st(db, "INSERT INTO availability_windows(id,provider_id,day_of_week,start_minute,end_minute,active) VALUES(?,?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& w : windows) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindText(st.get(), 1, w.id);
    BindText(st.get(), 2, provider_id);
    BindU64(st.get(), 3, w.day_of_week);
    BindU64(st.get(), 4, w.start_minute);
    BindU64(st.get(), 5, w.end_minute);
    BindI32(st.get(), 6, w.active ? 1 : 0);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }
  return Result::Ok();
}

std::vector<model::AvailabilityWindowRecord> SqliteRepository::ListAvailabilityWindows(Transaction& t, const std::string& provider_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,provider_id,day_of_week,start_minute,end_minute,active FROM availability_windows "
               "WHERE provider_id=? AND active=1 ORDER BY day_of_week, start_minute;");
  st.Require();
  BindText(st.get(), 1, provider_id);

  return CollectRows<model::AvailabilityWindowRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::AvailabilityWindowRecord w;
    w.id           = ColText(s, 0);
    w.provider_id  = ColText(s, 1);
    w.day_of_week  = ColU32(s, 2);
    w.start_minute = ColU32(s, 3);
    w.end_minute   = ColU32(s, 4);
    w.active       = sqlite3_column_int(s, 5) != 0;
    return w;
  });
}

Result SqliteRepository::InsertBlockedSlot(Transaction& t, const model::BlockedSlotRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO blocked_slots(id,provider_id,date,full_day,start_minute,end_minute,reason,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.provider_id);
  BindText(st.get(), 3, r.date);
  BindI32(st.get(), 4, r.full_day ? 1 : 0);
  BindU64(st.get(), 5, r.start_minute);
  BindU64(st.get(), 6, r.end_minute);
  BindNullableText(st.get(), 7, r.reason);
  BindU64(st.get(), 8, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteBlockedSlot(Transaction& t, const std::string& provider_id, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM blocked_slots WHERE id=? AND provider_id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);
  BindText(st.get(), 2, provider_id);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "blocked slot not found: " + id);
  return Result::Ok();
}

std::vector<model::BlockedSlotRecord> SqliteRepository::ListBlockedSlots(Transaction& t, const std::string& provider_id,
                                                                         const DateRange& range) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,provider_id,date,full_day,start_minute,end_minute,reason,created_at_ms FROM blocked_slots "
               "WHERE provider_id=? AND date>=? AND date<=? ORDER BY date, start_minute;");
  st.Require();
  BindText(st.get(), 1, provider_id);
  BindText(st.get(), 2, range.from);
  BindText(st.get(), 3, range.to);

  return CollectRows<model::BlockedSlotRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::BlockedSlotRecord b;
    b.id            = ColText(s, 0);
    b.provider_id   = ColText(s, 1);
    b.date          = ColText(s, 2);
    b.full_day      = sqlite3_column_int(s, 3) != 0;
    b.start_minute  = ColU32(s, 4);
    b.end_minute    = ColU32(s, 5);
    b.reason        = ColText(s, 6);
    b.created_at_ms = ColU64(s, 7);
    return b;
  });
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

// BEGIN IMMEDIATE already holds the database write lock, and the connection
// mutex keeps in-process transactions apart.
Result SqliteRepository::LockProviderDate(Transaction&, const std::string&, const std::string&) {
  return Result::Ok();
}

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO bookings(") + kBookingColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement         st(db, sql.c_str());
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.id);
  BindText(s, 2, r.provider_id);
  BindNullableText(s, 3, r.customer_id);
  BindNullableText(s, 4, r.guest_email);
  BindText(s, 5, r.date);
  BindU64(s, 6, r.start_minute);
  BindU64(s, 7, r.end_minute);
  BindText(s, 8, StatusText(r.status));
  BindI64(s, 9, r.total_cents);
  BindI64(s, 10, r.platform_fee_cents);
  BindI64(s, 11, r.provider_payout_cents);
  BindText(s, 12, r.currency);
  BindText(s, 13, r.confirmation_code);
  BindU64(s, 14, r.cancelled_at_ms);
  BindNullableText(s, 15, r.cancelled_by);
  BindNullableText(s, 16, r.cancellation_reason);
  BindI64(s, 17, r.cancellation_fee_cents);
  BindU64(s, 18, r.created_at_ms);
  BindU64(s, 19, r.updated_at_ms);
  BindU64(s, 20, r.version);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id=?;";
  Statement         st(db, sql.c_str());
  st.Require();
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadBooking(st.get());
}

std::optional<model::BookingRecord> SqliteRepository::GetBookingByConfirmationCode(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE confirmation_code=?;";
  Statement         st(db, sql.c_str());
  st.Require();
  BindText(st.get(), 1, code);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadBooking(st.get());
}

std::vector<model::BookingRecord> SqliteRepository::ListOccupyingBookings(Transaction& t, const std::string& provider_id,
                                                                          const DateRange& range) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kBookingColumns +
                          " FROM bookings WHERE provider_id=? AND date>=? AND date<=? "
                          "AND status NOT IN ('cancelled','no_show','refunded') ORDER BY date, start_minute;";
  Statement st(db, sql.c_str());
  st.Require();
  BindText(st.get(), 1, provider_id);
  BindText(st.get(), 2, range.from);
  BindText(st.get(), 3, range.to);

  return CollectRows<model::BookingRecord>(db, st.get(), ReadBooking);
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE bookings SET date=?,start_minute=?,end_minute=?,status=?,total_cents=?,platform_fee_cents=?,"
               "provider_payout_cents=?,cancelled_at_ms=?,cancelled_by=?,cancellation_reason=?,cancellation_fee_cents=?,"
               "updated_at_ms=?,version=? WHERE id=? AND version=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.date);
  BindU64(s, 2, r.start_minute);
  BindU64(s, 3, r.end_minute);
  BindText(s, 4, StatusText(r.status));
  BindI64(s, 5, r.total_cents);
  BindI64(s, 6, r.platform_fee_cents);
  BindI64(s, 7, r.provider_payout_cents);
  BindU64(s, 8, r.cancelled_at_ms);
  BindNullableText(s, 9, r.cancelled_by);
  BindNullableText(s, 10, r.cancellation_reason);
  BindI64(s, 11, r.cancellation_fee_cents);
  BindU64(s, 12, r.updated_at_ms);
  BindU64(s, 13, r.version);
  BindText(s, 14, r.id);
  BindU64(s, 15, expected_version);

  if (auto res = Translate(db, sqlite3_step(s)); !res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetBooking(t, r.id)) return Result::Err(ErrorCode::NotFound, "booking not found: " + r.id);
    return Result::Err(ErrorCode::Conflict, "booking version changed: " + r.id);
  }
  return Result::Ok();
}

Result SqliteRepository::InsertTransition(Transaction& t, const model::TransitionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO booking_transitions(id,booking_id,from_status,to_status,triggered_by,reason,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.booking_id);
  if (r.from_status) {
    BindText(st.get(), 3, StatusText(*r.from_status));
  } else {
    sqlite3_bind_null(st.get(), 3);
  }
  BindText(st.get(), 4, StatusText(r.to_status));
  BindNullableText(st.get(), 5, r.triggered_by);
  BindNullableText(st.get(), 6, r.reason);
  BindU64(st.get(), 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TransitionRecord> SqliteRepository::ListTransitions(Transaction& t, const std::string& booking_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,booking_id,from_status,to_status,triggered_by,reason,created_at_ms FROM booking_transitions "
               "WHERE booking_id=? ORDER BY created_at_ms, rowid;");
  st.Require();
  BindText(st.get(), 1, booking_id);

  return CollectRows<model::TransitionRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::TransitionRecord r;
    r.id         = ColText(s, 0);
    r.booking_id = ColText(s, 1);
    if (sqlite3_column_type(s, 2) != SQLITE_NULL) {
      r.from_status = ColBookingStatus(s, 2);
    }
    r.to_status     = ColBookingStatus(s, 3);
    r.triggered_by  = ColText(s, 4);
    r.reason        = ColText(s, 5);
    r.created_at_ms = ColU64(s, 6);
    return r;
  });
}

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO ledger_entries(id,booking_id,kind,amount_cents,currency,created_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.booking_id);
  BindText(st.get(), 3, r.kind);
  BindI64(st.get(), 4, r.amount_cents);
  BindText(st.get(), 5, r.currency);
  BindU64(st.get(), 6, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListLedgerEntries(Transaction& t, const std::string& booking_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,booking_id,kind,amount_cents,currency,created_at_ms FROM ledger_entries WHERE booking_id=? "
               "ORDER BY created_at_ms, rowid;");
  st.Require();
  BindText(st.get(), 1, booking_id);

  return CollectRows<model::LedgerEntryRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::LedgerEntryRecord r;
    r.id            = ColText(s, 0);
    r.booking_id    = ColText(s, 1);
    r.kind          = ColText(s, 2);
    r.amount_cents  = ColI64(s, 3);
    r.currency      = ColText(s, 4);
    r.created_at_ms = ColU64(s, 5);
    return r;
  });
}

// ------------------------------------------------------------------
// Slot locks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO slot_locks(lock_id,provider_id,date,start_minute,end_minute,session_id,locked_until_ms,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(lock_id) DO UPDATE SET locked_until_ms=excluded.locked_until_ms;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.lock_id);
  BindText(st.get(), 2, r.provider_id);
  BindText(st.get(), 3, r.date);
  BindU64(st.get(), 4, r.start_minute);
  BindU64(st.get(), 5, r.end_minute);
  BindText(st.get(), 6, r.session_id);
  BindU64(st.get(), 7, r.locked_until_ms);
  BindU64(st.get(), 8, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SlotLockRecord> SqliteRepository::GetSlotLock(Transaction& t, const std::string& lock_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT lock_id,provider_id,date,start_minute,end_minute,session_id,locked_until_ms,created_at_ms "
               "FROM slot_locks WHERE lock_id=?;");
  st.Require();
  BindText(st.get(), 1, lock_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSlotLock(st.get());
}

std::vector<model::SlotLockRecord> SqliteRepository::ListSlotLocks(Transaction& t, const std::string& provider_id, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT lock_id,provider_id,date,start_minute,end_minute,session_id,locked_until_ms,created_at_ms "
               "FROM slot_locks WHERE provider_id=? AND date=? ORDER BY start_minute;");
  st.Require();
  BindText(st.get(), 1, provider_id);
  BindText(st.get(), 2, date);

  return CollectRows<model::SlotLockRecord>(db, st.get(), ReadSlotLock);
}

Result SqliteRepository::DeleteSlotLock(Transaction& t, const std::string& lock_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM slot_locks WHERE lock_id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, lock_id);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "slot lock not found: " + lock_id);
  return Result::Ok();
}

Result SqliteRepository::DeleteExpiredSlotLocks(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM slot_locks WHERE locked_until_ms<=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, now_ms);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Availability cache
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date,
                                            uint32_t duration_minutes, const std::vector<model::AvailabilityCacheRecord>& slots) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "DELETE FROM availability_cache WHERE provider_id=? AND date=? AND duration_minutes=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, provider_id);
    BindText(st.get(), 2, date);
    BindU64(st.get(), 3, duration_minutes);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  Statement st(db,
               "INSERT INTO availability_cache(provider_id,date,duration_minutes,start_minute,end_minute,available,expires_at_ms) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& slot : slots) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindText(st.get(), 1, provider_id);
    BindText(st.get(), 2, date);
    BindU64(st.get(), 3, duration_minutes);
    BindU64(st.get(), 4, slot.start_minute);
    BindU64(st.get(), 5, slot.end_minute);
    BindI32(st.get(), 6, slot.available ? 1 : 0);
    BindU64(st.get(), 7, slot.expires_at_ms);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }
  return Result::Ok();
}

std::vector<model::AvailabilityCacheRecord> SqliteRepository::GetCachedSlots(Transaction& t, const std::string& provider_id,
                                                                             const std::string& date, uint32_t duration_minutes,
                                                                             uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT provider_id,date,start_minute,end_minute,available,expires_at_ms FROM availability_cache "
               "WHERE provider_id=? AND date=? AND duration_minutes=? AND expires_at_ms>? ORDER BY start_minute;");
  st.Require();
  BindText(st.get(), 1, provider_id);
  BindText(st.get(), 2, date);
  BindU64(st.get(), 3, duration_minutes);
  BindU64(st.get(), 4, now_ms);

  return CollectRows<model::AvailabilityCacheRecord>(db, st.get(), [](sqlite3_stmt* s) {
    model::AvailabilityCacheRecord r;
    r.provider_id   = ColText(s, 0);
    r.date          = ColText(s, 1);
    r.start_minute  = ColU32(s, 2);
    r.end_minute    = ColU32(s, 3);
    r.available     = sqlite3_column_int(s, 4) != 0;
    r.expires_at_ms = ColU64(s, 5);
    return r;
  });
}

Result SqliteRepository::InvalidateCachedSlots(Transaction& t, const std::string& provider_id, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM availability_cache WHERE provider_id=? AND date=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, provider_id);
  BindText(st.get(), 2, date);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteExpiredCachedSlots(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM availability_cache WHERE expires_at_ms<=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, now_ms);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payouts
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayout(Transaction& t, const model::PayoutRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO payouts(") + kPayoutColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement         st(db, sql.c_str());
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, r.id);
  BindText(s, 2, r.booking_id);
  BindText(s, 3, r.provider_id);
  BindI64(s, 4, r.amount_cents);
  BindText(s, 5, r.currency);
  BindText(s, 6, StatusText(r.status));
  BindU64(s, 7, r.scheduled_at_ms);
  BindU64(s, 8, r.retry_count);
  BindNullableText(s, 9, r.external_transfer_id);
  BindNullableText(s, 10, r.failure_reason);
  BindU64(s, 11, r.processed_at_ms);
  BindU64(s, 12, r.created_at_ms);
  BindU64(s, 13, r.updated_at_ms);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::PayoutRecord> SqliteRepository::GetPayout(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPayoutColumns + " FROM payouts WHERE id=?;";
  Statement         st(db, sql.c_str());
  st.Require();
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPayout(st.get());
}

std::optional<model::PayoutRecord> SqliteRepository::GetPayoutByBooking(Transaction& t, const std::string& booking_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPayoutColumns + " FROM payouts WHERE booking_id=?;";
  Statement         st(db, sql.c_str());
  st.Require();
  BindText(st.get(), 1, booking_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPayout(st.get());
}

Result SqliteRepository::UpdatePayout(Transaction& t, const model::PayoutRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE payouts SET status=?,scheduled_at_ms=?,retry_count=?,external_transfer_id=?,failure_reason=?,"
               "processed_at_ms=?,updated_at_ms=? WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* s = st.get();
  BindText(s, 1, StatusText(r.status));
  BindU64(s, 2, r.scheduled_at_ms);
  BindU64(s, 3, r.retry_count);
  BindNullableText(s, 4, r.external_transfer_id);
  BindNullableText(s, 5, r.failure_reason);
  BindU64(s, 6, r.processed_at_ms);
  BindU64(s, 7, r.updated_at_ms);
  BindText(s, 8, r.id);

  if (auto res = Translate(db, sqlite3_step(s)); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "payout not found: " + r.id);
  return Result::Ok();
}

std::vector<model::PayoutRecord> SqliteRepository::ClaimDuePayouts(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto* db = TX(t).Handle();

  // The write lock taken by BEGIN IMMEDIATE makes the claim exclusive.
  const std::string sql = std::string("UPDATE payouts SET status='processing', updated_at_ms=?1 WHERE id IN (") +
                          "SELECT id FROM payouts WHERE status='scheduled' AND scheduled_at_ms<=?1 "
                          "ORDER BY scheduled_at_ms LIMIT ?2) RETURNING " +
                          kPayoutColumns + ";";
  Statement st(db, sql.c_str());
  st.Require();
  BindU64(st.get(), 1, now_ms);
  BindU64(st.get(), 2, limit);

  auto claimed = CollectRows<model::PayoutRecord>(db, st.get(), ReadPayout);
  std::sort(claimed.begin(), claimed.end(),
            [](const model::PayoutRecord& a, const model::PayoutRecord& b) { return a.scheduled_at_ms < b.scheduled_at_ms; });
  return claimed;
}

std::vector<model::PayoutRecord> SqliteRepository::ListPayouts(Transaction& t, const PayoutFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kPayoutColumns + " FROM payouts WHERE 1=1";
  if (!filter.provider_id.empty()) {
    sql += " AND provider_id=?";
  }
  if (!filter.statuses.empty()) {
    sql += " AND status IN (";
    for (size_t i = 0; i < filter.statuses.size(); ++i) {
      sql += i == 0 ? "?" : ",?";
    }
    sql += ")";
  }
  sql += " ORDER BY scheduled_at_ms DESC, id";
  if (filter.page.limit > 0) {
    sql += " LIMIT ? OFFSET ?";
  } else if (filter.page.offset > 0) {
    sql += " LIMIT -1 OFFSET ?";
  }
  sql += ";";

  Statement st(db, sql.c_str());
  st.Require();

  int idx = 1;
  if (!filter.provider_id.empty()) {
    BindText(st.get(), idx++, filter.provider_id);
  }
  for (auto status : filter.statuses) {
    BindText(st.get(), idx++, StatusText(status));
  }
  if (filter.page.limit > 0) {
    BindU64(st.get(), idx++, filter.page.limit);
    BindU64(st.get(), idx++, filter.page.offset);
  } else if (filter.page.offset > 0) {
    BindU64(st.get(), idx++, filter.page.offset);
  }

  return CollectRows<model::PayoutRecord>(db, st.get(), ReadPayout);
}

} // namespace booking::db::sqlite
