#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace booking::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      BOOKING_LOG_WARN("postgres rollback failed", {booking::observability::StringField("error", e.what())});
    }
  }
  // The work must be gone before its connection returns to the pool.
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw CommitConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw CommitConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
