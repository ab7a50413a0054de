#include "pg_pool.hpp"

namespace booking::db::postgres {

namespace {

constexpr const char* kBookingColumns =
    "id,provider_id,customer_id,guest_email,date,start_minute,end_minute,status,total_cents,platform_fee_cents,"
    "provider_payout_cents,currency,confirmation_code,cancelled_at_ms,cancelled_by,cancellation_reason,"
    "cancellation_fee_cents,created_at_ms,updated_at_ms,version";

constexpr const char* kPayoutColumns =
    "id,booking_id,provider_id,amount_cents,currency,status,scheduled_at_ms,retry_count,external_transfer_id,"
    "failure_reason,processed_at_ms,created_at_ms,updated_at_ms";

constexpr const char* kSlotLockColumns = "lock_id,provider_id,date,start_minute,end_minute,session_id,locked_until_ms,created_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string booking_cols = kBookingColumns;
  const std::string payout_cols  = kPayoutColumns;
  const std::string lock_cols    = kSlotLockColumns;

  conn.prepare("get_booking", "SELECT " + booking_cols + " FROM bookings WHERE id=$1");

  conn.prepare("get_booking_by_code", "SELECT " + booking_cols + " FROM bookings WHERE confirmation_code=$1");

  conn.prepare("insert_booking", "INSERT INTO bookings(" + booking_cols +
                                     ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20)");

  conn.prepare("update_booking",
               "UPDATE bookings SET date=$2,start_minute=$3,end_minute=$4,status=$5,total_cents=$6,platform_fee_cents=$7,"
               "provider_payout_cents=$8,cancelled_at_ms=$9,cancelled_by=$10,cancellation_reason=$11,cancellation_fee_cents=$12,"
               "updated_at_ms=$13,version=$14 WHERE id=$1 AND version=$15");

  conn.prepare("list_occupying_bookings", "SELECT " + booking_cols +
                                              " FROM bookings WHERE provider_id=$1 AND date BETWEEN $2 AND $3 "
                                              "AND status NOT IN ('cancelled','no_show','refunded') ORDER BY date, start_minute");

  conn.prepare("lock_provider_date", "SELECT pg_advisory_xact_lock(hashtext($1 || '#' || $2))");

  conn.prepare("get_slot_lock", "SELECT " + lock_cols + " FROM slot_locks WHERE lock_id=$1");

  conn.prepare("list_slot_locks", "SELECT " + lock_cols + " FROM slot_locks WHERE provider_id=$1 AND date=$2 ORDER BY start_minute");

  conn.prepare("upsert_slot_lock", "INSERT INTO slot_locks(" + lock_cols +
                                       ") VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
                                       "ON CONFLICT(lock_id) DO UPDATE SET locked_until_ms=EXCLUDED.locked_until_ms");

  conn.prepare("get_payout", "SELECT " + payout_cols + " FROM payouts WHERE id=$1");

  conn.prepare("get_payout_by_booking", "SELECT " + payout_cols + " FROM payouts WHERE booking_id=$1");

  conn.prepare("claim_due_payouts", "UPDATE payouts SET status='processing', updated_at_ms=$1 WHERE id IN ("
                                    "SELECT id FROM payouts WHERE status='scheduled' AND scheduled_at_ms <= $1 "
                                    "ORDER BY scheduled_at_ms LIMIT $2 FOR UPDATE SKIP LOCKED) RETURNING " +
                                        payout_cols);
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    // A broken connection is dropped rather than handed to the next caller.
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace booking::db::postgres
