#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace linecheck::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), hold_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (IsOpen()) {
    RollbackQuietly("abandoned");
  }
}

void SqliteTransaction::CommitWrites() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    // a failed COMMIT leaves the connection inside the transaction
    RollbackQuietly("commit failed");
    hold_.unlock();
    throw;
  }
  hold_.unlock();
}

void SqliteTransaction::DiscardWrites() {
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    hold_.unlock();
    throw;
  }
  hold_.unlock();
}

void SqliteTransaction::RollbackQuietly(const char* reason) noexcept {
  if (sqlite3_get_autocommit(db_->Handle()) != 0) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    LINECHECK_LOG_ERROR("sqlite rollback failed", {observability::StringField("reason", reason), observability::StringField("error", ex.what())});
  }
}

} // namespace linecheck::db::sqlite
