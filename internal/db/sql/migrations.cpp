#include "migrations.hpp"

namespace booking::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

// Slot-occupying statuses are everything except cancelled, no_show and refunded.

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS providers (id TEXT PRIMARY KEY, display_name TEXT NOT NULL, utc_offset_minutes INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS availability_windows (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), "
      "day_of_week INTEGER NOT NULL CHECK (day_of_week BETWEEN 0 AND 6), start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, "
      "active INTEGER NOT NULL DEFAULT 1, CHECK (start_minute < end_minute AND end_minute <= 1440));",
      "CREATE INDEX IF NOT EXISTS availability_windows_provider ON availability_windows(provider_id, active);",

      "CREATE TABLE IF NOT EXISTS blocked_slots (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), date TEXT NOT NULL, "
      "full_day INTEGER NOT NULL, start_minute INTEGER NOT NULL DEFAULT 0, end_minute INTEGER NOT NULL DEFAULT 0, reason TEXT, "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS blocked_slots_provider_date ON blocked_slots(provider_id, date);",

      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), customer_id TEXT, "
      "guest_email TEXT, date TEXT NOT NULL, start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, status TEXT NOT NULL, "
      "total_cents INTEGER NOT NULL, platform_fee_cents INTEGER NOT NULL, provider_payout_cents INTEGER NOT NULL, currency TEXT NOT NULL, "
      "confirmation_code TEXT NOT NULL UNIQUE, cancelled_at_ms INTEGER NOT NULL DEFAULT 0, cancelled_by TEXT, cancellation_reason TEXT, "
      "cancellation_fee_cents INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "version INTEGER NOT NULL, CHECK (start_minute < end_minute));",
      "CREATE INDEX IF NOT EXISTS bookings_provider_date ON bookings(provider_id, date, status);",

      "CREATE TRIGGER IF NOT EXISTS bookings_no_overlap_insert BEFORE INSERT ON bookings "
      "WHEN NEW.status NOT IN ('cancelled','no_show','refunded') BEGIN "
      "SELECT RAISE(ABORT, 'booking overlaps an existing booking') WHERE EXISTS (SELECT 1 FROM bookings b "
      "WHERE b.provider_id = NEW.provider_id AND b.date = NEW.date AND b.status NOT IN ('cancelled','no_show','refunded') "
      "AND b.start_minute < NEW.end_minute AND NEW.start_minute < b.end_minute); END;",

      "CREATE TRIGGER IF NOT EXISTS bookings_no_overlap_update BEFORE UPDATE OF status, date, start_minute, end_minute ON bookings "
      "WHEN NEW.status NOT IN ('cancelled','no_show','refunded') BEGIN "
      "SELECT RAISE(ABORT, 'booking overlaps an existing booking') WHERE EXISTS (SELECT 1 FROM bookings b "
      "WHERE b.id <> NEW.id AND b.provider_id = NEW.provider_id AND b.date = NEW.date AND b.status NOT IN ('cancelled','no_show','refunded') "
      "AND b.start_minute < NEW.end_minute AND NEW.start_minute < b.end_minute); END;",

      "CREATE TABLE IF NOT EXISTS booking_transitions (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id), from_status TEXT, "
      "to_status TEXT NOT NULL, triggered_by TEXT, reason TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS booking_transitions_booking ON booking_transitions(booking_id, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS ledger_entries (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id), kind TEXT NOT NULL, "
      "amount_cents INTEGER NOT NULL, currency TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS slot_locks (lock_id TEXT PRIMARY KEY, provider_id TEXT NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, "
      "end_minute INTEGER NOT NULL, session_id TEXT NOT NULL, locked_until_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS slot_locks_provider_date ON slot_locks(provider_id, date);",
      "CREATE INDEX IF NOT EXISTS slot_locks_expiry ON slot_locks(locked_until_ms);",

      "CREATE TABLE IF NOT EXISTS availability_cache (provider_id TEXT NOT NULL, date TEXT NOT NULL, duration_minutes INTEGER NOT NULL, "
      "start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, available INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (provider_id, date, duration_minutes, start_minute));",
      "CREATE INDEX IF NOT EXISTS availability_cache_expiry ON availability_cache(expires_at_ms);",

      "CREATE TABLE IF NOT EXISTS payouts (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL UNIQUE REFERENCES bookings(id), provider_id TEXT NOT NULL, "
      "amount_cents INTEGER NOT NULL, currency TEXT NOT NULL, status TEXT NOT NULL, scheduled_at_ms INTEGER NOT NULL, "
      "retry_count INTEGER NOT NULL DEFAULT 0, external_transfer_id TEXT, failure_reason TEXT, processed_at_ms INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS payouts_due ON payouts(status, scheduled_at_ms);",
      "CREATE INDEX IF NOT EXISTS payouts_provider ON payouts(provider_id, status);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE EXTENSION IF NOT EXISTS btree_gist;",

      "CREATE TABLE IF NOT EXISTS providers (id TEXT PRIMARY KEY, display_name TEXT NOT NULL, utc_offset_minutes INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS availability_windows (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), "
      "day_of_week SMALLINT NOT NULL CHECK (day_of_week BETWEEN 0 AND 6), start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, "
      "active BOOLEAN NOT NULL DEFAULT TRUE, CHECK (start_minute < end_minute AND end_minute <= 1440));",
      "CREATE INDEX IF NOT EXISTS availability_windows_provider ON availability_windows(provider_id, active);",

      "CREATE TABLE IF NOT EXISTS blocked_slots (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), date TEXT NOT NULL, "
      "full_day BOOLEAN NOT NULL, start_minute INTEGER NOT NULL DEFAULT 0, end_minute INTEGER NOT NULL DEFAULT 0, reason TEXT, "
      "created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS blocked_slots_provider_date ON blocked_slots(provider_id, date);",

      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, provider_id TEXT NOT NULL REFERENCES providers(id), customer_id TEXT, "
      "guest_email TEXT, date TEXT NOT NULL, start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, status TEXT NOT NULL, "
      "total_cents BIGINT NOT NULL, platform_fee_cents BIGINT NOT NULL, provider_payout_cents BIGINT NOT NULL, currency TEXT NOT NULL, "
      "confirmation_code TEXT NOT NULL UNIQUE, cancelled_at_ms BIGINT NOT NULL DEFAULT 0, cancelled_by TEXT, cancellation_reason TEXT, "
      "cancellation_fee_cents BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL, "
      "CHECK (start_minute < end_minute), "
      "CONSTRAINT bookings_no_overlap EXCLUDE USING gist (provider_id WITH =, date WITH =, int4range(start_minute, end_minute) WITH &&) "
      "WHERE (status NOT IN ('cancelled','no_show','refunded')));",

      "CREATE TABLE IF NOT EXISTS booking_transitions (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id), from_status TEXT, "
      "to_status TEXT NOT NULL, triggered_by TEXT, reason TEXT, created_at_ms BIGINT NOT NULL, seq BIGSERIAL);",
      "CREATE INDEX IF NOT EXISTS booking_transitions_booking ON booking_transitions(booking_id, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS ledger_entries (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL REFERENCES bookings(id), kind TEXT NOT NULL, "
      "amount_cents BIGINT NOT NULL, currency TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS slot_locks (lock_id TEXT PRIMARY KEY, provider_id TEXT NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, "
      "end_minute INTEGER NOT NULL, session_id TEXT NOT NULL, locked_until_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS slot_locks_provider_date ON slot_locks(provider_id, date);",
      "CREATE INDEX IF NOT EXISTS slot_locks_expiry ON slot_locks(locked_until_ms);",

      "CREATE TABLE IF NOT EXISTS availability_cache (provider_id TEXT NOT NULL, date TEXT NOT NULL, duration_minutes INTEGER NOT NULL, "
      "start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, available BOOLEAN NOT NULL, expires_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (provider_id, date, duration_minutes, start_minute));",
      "CREATE INDEX IF NOT EXISTS availability_cache_expiry ON availability_cache(expires_at_ms);",

      "CREATE TABLE IF NOT EXISTS payouts (id TEXT PRIMARY KEY, booking_id TEXT NOT NULL UNIQUE REFERENCES bookings(id), provider_id TEXT NOT NULL, "
      "amount_cents BIGINT NOT NULL, currency TEXT NOT NULL, status TEXT NOT NULL, scheduled_at_ms BIGINT NOT NULL, "
      "retry_count INTEGER NOT NULL DEFAULT 0, external_transfer_id TEXT, failure_reason TEXT, processed_at_ms BIGINT NOT NULL DEFAULT 0, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS payouts_due ON payouts(status, scheduled_at_ms);",
      "CREATE INDEX IF NOT EXISTS payouts_provider ON payouts(provider_id, status);",
  };
  return kSchema;
}

} // namespace booking::db::sql
