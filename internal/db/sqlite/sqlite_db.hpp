#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace linecheck::db::sqlite {

struct SqliteOptions {
  bool wal_mode = true;
  // FULL fsyncs every commit so an acknowledged scan survives power loss.
  bool                      synchronous_full = true;
  std::chrono::milliseconds busy_timeout{5000};
};

/*
  The line's single SQLite connection.

  Opened in serialized mode and shared by every transaction; the
  transaction mutex makes them take turns.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::string& path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Runs one or more statements without results. Throws std::runtime_error.
  void Exec(const std::string& sql);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*   db_ = nullptr;
  std::mutex tx_mutex_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, const char* sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace linecheck::db::sqlite
