#include "sqlite_db.hpp"

#include <stdexcept>

namespace linecheck::db::sqlite {

namespace {

std::runtime_error SqliteError(const std::string& what, sqlite3* db) {
  return std::runtime_error("sqlite " + what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

SqliteDB::SqliteDB(const std::string& path, SqliteOptions options) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto error = SqliteError("open '" + path + "'", db_);
    sqlite3_close(db_);
    throw error;
  }

  std::string pragmas = "PRAGMA foreign_keys=ON; PRAGMA temp_store=MEMORY;";
  pragmas += options.synchronous_full ? " PRAGMA synchronous=FULL;" : " PRAGMA synchronous=NORMAL;";
  if (options.wal_mode) {
    pragmas += " PRAGMA journal_mode=WAL;";
  }

  try {
    if (sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout.count())) != SQLITE_OK) {
      throw SqliteError("busy_timeout", db_);
    }
    Exec(pragmas);
  } catch (const std::runtime_error&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* message = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) == SQLITE_OK) {
    return;
  }
  std::string error = message ? message : sqlite3_errmsg(db_);
  sqlite3_free(message);
  throw std::runtime_error("sqlite exec: " + error);
}

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    auto error = SqliteError("prepare", db);
    sqlite3_finalize(stmt_);
    throw error;
  }
}

SqliteStatement::~SqliteStatement() {
  sqlite3_finalize(stmt_);
}

} // namespace linecheck::db::sqlite
