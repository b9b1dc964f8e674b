#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace linecheck::db::sqlite {

namespace {

// Databases created before a column existed get it added in place.
bool HasColumn(SqliteDB& db, const char* table, const char* column) {
  SqliteStatement st(db.Handle(), "SELECT 1 FROM pragma_table_info(?1) WHERE name = ?2;");
  sqlite3_bind_text(st.get(), 1, table, -1, SQLITE_STATIC);
  sqlite3_bind_text(st.get(), 2, column, -1, SQLITE_STATIC);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite table_info: ") + sqlite3_errmsg(db.Handle()));
  }
  return rc == SQLITE_ROW;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS jobs (job_id TEXT PRIMARY KEY, expected_barcode TEXT NOT NULL, pieces_per_shipper INTEGER NOT NULL, "
      "target_quantity INTEGER NOT NULL, start_time_ms INTEGER NOT NULL, end_time_ms INTEGER, is_active INTEGER NOT NULL, "
      "total_scans INTEGER NOT NULL DEFAULT 0, pass_count INTEGER NOT NULL DEFAULT 0, fail_count INTEGER NOT NULL DEFAULT 0, "
      "total_pieces INTEGER NOT NULL DEFAULT 0, is_locked INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS jobs_single_active ON jobs(is_active) WHERE is_active = 1;",
      "CREATE INDEX IF NOT EXISTS jobs_start_time ON jobs(start_time_ms DESC, job_id DESC);",
      "CREATE TABLE IF NOT EXISTS scans (id INTEGER PRIMARY KEY AUTOINCREMENT, job_id TEXT NOT NULL REFERENCES jobs(job_id), barcode TEXT NOT NULL, "
      "expected TEXT NOT NULL, status INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS scans_job ON scans(job_id, id);",
      "CREATE TABLE IF NOT EXISTS hour_buckets (job_id TEXT NOT NULL REFERENCES jobs(job_id), date TEXT NOT NULL, hour INTEGER NOT NULL, "
      "shippers INTEGER NOT NULL DEFAULT 0, pieces INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (job_id, date, hour));",
      "CREATE INDEX IF NOT EXISTS hour_buckets_date ON hour_buckets(date, hour);",
      "CREATE TABLE IF NOT EXISTS shift_stats (date TEXT PRIMARY KEY, total_shippers INTEGER NOT NULL DEFAULT 0, total_pieces INTEGER NOT NULL DEFAULT 0, "
      "total_pass INTEGER NOT NULL DEFAULT 0, total_fail INTEGER NOT NULL DEFAULT 0, jobs_completed INTEGER NOT NULL DEFAULT 0);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  if (!HasColumn(db, "jobs", "is_locked")) {
    db.Exec("ALTER TABLE jobs ADD COLUMN is_locked INTEGER NOT NULL DEFAULT 0;");
  }

  db.Exec("SELECT job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,is_locked FROM jobs LIMIT 1;");
  db.Exec("SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans LIMIT 1;");
  db.Exec("SELECT job_id,date,hour,shippers,pieces FROM hour_buckets LIMIT 1;");
  db.Exec("SELECT date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed FROM shift_stats LIMIT 1;");
}

} // namespace linecheck::db::sqlite
