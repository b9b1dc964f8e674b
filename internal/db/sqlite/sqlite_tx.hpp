#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace linecheck::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection, so the write lock is taken up
  front and a scan never fails halfway on SQLITE_BUSY. The connection's
  transaction mutex is held until Commit() or Rollback(); do not open a
  second transaction on the same thread while this one is open.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 protected:
  void CommitWrites() override;
  void DiscardWrites() override;

 private:
  void RollbackQuietly(const char* reason) noexcept;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> hold_;
};

} // namespace linecheck::db::sqlite
