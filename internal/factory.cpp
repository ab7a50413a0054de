#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/availability/availability_service.hpp"
#include "internal/core/booking_coordinator.hpp"
#include "internal/core/booking_state_machine.hpp"
#include "internal/core/fee_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/lock/slot_lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payout/payout_scheduler.hpp"
#include "internal/payout/retry_policy.hpp"
#include "internal/worker/housekeeping_worker.hpp"
#if BOOKING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BOOKING_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace booking::factory {

namespace cfg = booking::runtime::config;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto value = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  return value.count() > 0 ? value : fallback;
}

template <typename T>
T OrDefault(T value, T fallback) {
  return value != T{} ? value : fallback;
}

#if BOOKING_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if BOOKING_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

availability::AvailabilityOptions ToAvailabilityOptions(const cfg::AvailabilityConfig& in) {
  availability::AvailabilityOptions out;
  out.slot_granularity_minutes = OrDefault(in.slot_granularity_minutes(), out.slot_granularity_minutes);
  out.cache_ttl                = ToMillis(in.cache_ttl(), out.cache_ttl);
  out.alternative_count        = OrDefault(in.alternative_count(), out.alternative_count);
  out.search_horizon_days      = OrDefault(in.search_horizon_days(), out.search_horizon_days);
  out.min_lead_time            = ToMillis(in.min_lead_time(), out.min_lead_time);
  out.max_range_days           = OrDefault(in.max_range_days(), out.max_range_days);
  return out;
}

lock::SlotLockOptions ToSlotLockOptions(const cfg::SlotLockConfig& in) {
  lock::SlotLockOptions out;
  out.default_ttl = ToMillis(in.default_ttl(), out.default_ttl);
  out.max_ttl     = ToMillis(in.max_ttl(), out.max_ttl);
  return out;
}

core::BookingOptions ToBookingOptions(const cfg::BookingConfig& in) {
  core::BookingOptions out;
  out.late_cancel_window       = ToMillis(in.late_cancel_window(), out.late_cancel_window);
  out.late_cancel_fee_percent  = OrDefault(in.late_cancel_fee_percent(), out.late_cancel_fee_percent);
  out.confirmation_code_length = OrDefault(in.confirmation_code_length(), out.confirmation_code_length);
  out.max_commit_attempts      = OrDefault(in.max_commit_attempts(), out.max_commit_attempts);
  return out;
}

core::FeeOptions ToFeeOptions(const cfg::FeeConfig& in) {
  core::FeeOptions out;
  out.platform_fee_percent    = OrDefault(in.platform_fee_percent(), out.platform_fee_percent);
  out.guest_surcharge_percent = OrDefault(in.guest_surcharge_percent(), out.guest_surcharge_percent);
  out.min_price_cents         = OrDefault<int64_t>(in.min_price_cents(), out.min_price_cents);
  out.max_price_cents         = OrDefault<int64_t>(in.max_price_cents(), out.max_price_cents);
  out.currency                = in.currency().empty() ? out.currency : in.currency();
  return out;
}

payout::PayoutOptions ToPayoutOptions(const cfg::PayoutConfig& in) {
  payout::PayoutOptions out;
  out.escrow_days      = OrDefault(in.escrow_days(), out.escrow_days);
  out.batch_limit      = OrDefault(in.batch_limit(), out.batch_limit);
  out.transfer_timeout = ToMillis(in.transfer_timeout(), out.transfer_timeout);
  return out;
}

std::shared_ptr<payout::RetryPolicy> BuildRetryPolicy(const cfg::PayoutConfig& in) {
  if (in.retry_backoff_size() == 0 && in.max_retries() == 0) {
    return std::make_shared<payout::ScheduleRetryPolicy>();
  }

  std::vector<std::chrono::milliseconds> schedule;
  for (const auto& delay : in.retry_backoff()) {
    schedule.push_back(ToMillis(delay, std::chrono::hours(1)));
  }
  if (schedule.empty()) {
    schedule = {std::chrono::hours(1), std::chrono::hours(6), std::chrono::hours(24)};
  }
  const uint32_t max_retries = in.max_retries() != 0 ? in.max_retries() : static_cast<uint32_t>(schedule.size());
  return std::make_shared<payout::ScheduleRetryPolicy>(std::move(schedule), max_retries);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const cfg::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if BOOKING_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    BOOKING_LOG_INFO("using sqlite store", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BOOKING_DB_POSTGRES
    const auto& postgres = database.postgres();
    {
      // Prepared statements need the tables, so the schema goes in before the pool opens.
      pqxx::connection        conn(postgres.connection_uri());
      pqxx::work              tx(conn);
      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), OrDefault<uint32_t>(postgres.max_connections(), 16));
    BOOKING_LOG_INFO("using postgres store", {observability::IntField("max_connections", OrDefault<uint32_t>(postgres.max_connections(), 16))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BOOKING_LOG_WARN("using in-memory store; data is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const cfg::RuntimeConfig& config, std::shared_ptr<payout::PaymentProvider> provider) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Store and collaborators
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config.database());
  runtime.events  = std::make_shared<events::LoggingEventSink>();

  if (!provider) {
    BOOKING_LOG_WARN("no payment gateway configured; due payouts will be retried until one is");
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto availability = std::make_shared<availability::AvailabilityService>(repository, ToAvailabilityOptions(config.availability()));
  auto locks        = std::make_shared<lock::SlotLockManager>(repository, availability, ToSlotLockOptions(config.slot_locks()));
  auto payouts      = std::make_shared<payout::PayoutScheduler>(repository, std::move(provider), BuildRetryPolicy(config.payouts()), runtime.events,
                                                                ToPayoutOptions(config.payouts()));

  const auto booking_options = ToBookingOptions(config.bookings());
  auto       coordinator     = std::make_shared<core::BookingCoordinator>(repository, availability, locks, core::FeePolicy(ToFeeOptions(config.fees())),
                                                                runtime.events, booking_options);
  auto state_machine = std::make_shared<core::BookingStateMachine>(repository, availability, payouts, runtime.events, booking_options);

  // ------------------------------------------------------------------
  // Background jobs
  // ------------------------------------------------------------------
  worker::HousekeepingOptions housekeeping;
  housekeeping.payout_interval = ToMillis(config.payouts().poll_interval(), housekeeping.payout_interval);
  housekeeping.sweep_interval  = ToMillis(config.slot_locks().sweep_interval(), housekeeping.sweep_interval);
  runtime.housekeeping         = std::make_shared<worker::HousekeepingWorker>(payouts, locks, housekeeping);

  runtime.services.repository    = repository;
  runtime.services.availability  = availability;
  runtime.services.locks         = locks;
  runtime.services.coordinator   = coordinator;
  runtime.services.state_machine = state_machine;
  runtime.services.payouts       = payouts;
  return runtime;
}

} // namespace booking::factory
