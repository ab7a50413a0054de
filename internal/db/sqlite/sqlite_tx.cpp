#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace booking::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      BOOKING_LOG_WARN("sqlite rollback failed", {booking::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    const bool busy = (sqlite3_errcode(db_->Handle()) & 0xff) == SQLITE_BUSY;
    finished_       = true;
    if (sqlite3_get_autocommit(db_->Handle()) == 0) {
      db_->Exec("ROLLBACK;");
    }
    lock_.unlock();
    if (busy) {
      throw CommitConflict(e.what());
    }
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace booking::db::sqlite
