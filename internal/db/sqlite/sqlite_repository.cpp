#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace linecheck::db::sqlite {

using linecheck::db::ErrorCode;
using linecheck::db::Result;

namespace {

using Statement = SqliteStatement;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

constexpr const char* kJobColumns =
    "job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,"
    "total_scans,pass_count,fail_count,total_pieces,is_locked";

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.job_id             = ColText(st, 0);
  r.expected_barcode   = ColText(st, 1);
  r.pieces_per_shipper = ColI64(st, 2);
  r.target_quantity    = ColI64(st, 3);
  r.start_time_ms      = ColU64(st, 4);
  if (sqlite3_column_type(st, 5) != SQLITE_NULL) {
    r.end_time_ms = ColU64(st, 5);
  }
  r.is_active    = ColI32(st, 6) != 0;
  r.total_scans  = ColU64(st, 7);
  r.pass_count   = ColU64(st, 8);
  r.fail_count   = ColU64(st, 9);
  r.total_pieces = ColU64(st, 10);
  r.is_locked    = ColI32(st, 11) != 0;
  return r;
}

model::ScanRecord ReadScan(sqlite3_stmt* st) {
  model::ScanRecord r;
  r.id           = ColU64(st, 0);
  r.job_id       = ColText(st, 1);
  r.barcode      = ColText(st, 2);
  r.expected     = ColText(st, 3);
  r.status       = static_cast<linecheck::v1::ScanStatus>(ColI32(st, 4));
  r.timestamp_ms = ColU64(st, 5);
  return r;
}

model::HourBucketRecord ReadBucket(sqlite3_stmt* st) {
  model::HourBucketRecord r;
  r.job_id   = ColText(st, 0);
  r.date     = ColText(st, 1);
  r.hour     = static_cast<uint32_t>(ColI32(st, 2));
  r.shippers = ColU64(st, 3);
  r.pieces   = ColU64(st, 4);
  return r;
}

model::ShiftStatRecord ReadShift(sqlite3_stmt* st) {
  model::ShiftStatRecord r;
  r.date           = ColText(st, 0);
  r.total_shippers = ColU64(st, 1);
  r.total_pieces   = ColU64(st, 2);
  r.total_pass     = ColU64(st, 3);
  r.total_fail     = ColU64(st, 4);
  r.jobs_completed = ColU64(st, 5);
  return r;
}

void BindJobValues(sqlite3_stmt* st, const model::JobRecord& r) {
  BindText(st, 1, r.job_id);
  BindText(st, 2, r.expected_barcode);
  BindI64(st, 3, r.pieces_per_shipper);
  BindI64(st, 4, r.target_quantity);
  BindU64(st, 5, r.start_time_ms);
  if (r.end_time_ms) {
    BindU64(st, 6, *r.end_time_ms);
  } else {
    sqlite3_bind_null(st, 6);
  }
  BindI32(st, 7, r.is_active ? 1 : 0);
  BindU64(st, 8, r.total_scans);
  BindU64(st, 9, r.pass_count);
  BindU64(st, 10, r.fail_count);
  BindU64(st, 11, r.total_pieces);
  BindI32(st, 12, r.is_locked ? 1 : 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      // primary keys map to duplicates; the partial index on is_active to a constraint violation
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO jobs(job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,"
               "total_scans,pass_count,fail_count,total_pieces,is_locked) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  BindJobValues(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE jobs SET expected_barcode=?2,pieces_per_shipper=?3,target_quantity=?4,start_time_ms=?5,end_time_ms=?6,"
               "is_active=?7,total_scans=?8,pass_count=?9,fail_count=?10,total_pieces=?11,is_locked=?12 WHERE job_id=?1;");
  BindJobValues(st.get(), r);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + r.job_id + " not found");
  return Result::Ok();
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& job_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE job_id=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, job_id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.get());
}

std::optional<model::JobRecord> SqliteRepository::GetActiveJob(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE is_active=1 LIMIT 1;";
  Statement         st(db, sql.c_str());

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.get());
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, uint64_t offset, uint64_t limit) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs ORDER BY start_time_ms DESC, job_id DESC LIMIT ? OFFSET ?;";
  Statement         st(db, sql.c_str());
  BindU64(st.get(), 1, limit);
  BindU64(st.get(), 2, offset);

  std::vector<model::JobRecord> out;
  int                           rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadJob(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

uint64_t SqliteRepository::CountJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT COUNT(*) FROM jobs;");
  int       rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  return rc == SQLITE_ROW ? ColU64(st.get(), 0) : 0;
}

// ------------------------------------------------------------------
// Scan ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO scans(id,job_id,barcode,expected,status,timestamp_ms) VALUES(NULLIF(?,0),?,?,?,?,?);");
  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.job_id);
  BindText(st.get(), 3, r.barcode);
  BindText(st.get(), 4, r.expected);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindU64(st.get(), 6, r.timestamp_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::ScanRecord> SqliteRepository::ListRecentScans(Transaction& t, const std::string& job_id, uint64_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans WHERE job_id=? ORDER BY id DESC LIMIT ?;");
  BindText(st.get(), 1, job_id);
  BindU64(st.get(), 2, limit);

  std::vector<model::ScanRecord> out;
  int                            rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadScan(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

std::vector<model::ScanRecord> SqliteRepository::ListAllScans(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans ORDER BY id ASC;");

  std::vector<model::ScanRecord> out;
  int                            rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadScan(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Hour buckets
// ------------------------------------------------------------------

Result SqliteRepository::IncrementHourBucket(Transaction& t, const model::HourBucketRecord& delta) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO hour_buckets(job_id,date,hour,shippers,pieces) VALUES(?,?,?,?,?) "
               "ON CONFLICT(job_id,date,hour) DO UPDATE SET shippers=shippers+excluded.shippers, pieces=pieces+excluded.pieces;");
  BindText(st.get(), 1, delta.job_id);
  BindText(st.get(), 2, delta.date);
  BindI32(st.get(), 3, static_cast<int>(delta.hour));
  BindU64(st.get(), 4, delta.shippers);
  BindU64(st.get(), 5, delta.pieces);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertHourBucket(Transaction& t, const model::HourBucketRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO hour_buckets(job_id,date,hour,shippers,pieces) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, r.job_id);
  BindText(st.get(), 2, r.date);
  BindI32(st.get(), 3, static_cast<int>(r.hour));
  BindU64(st.get(), 4, r.shippers);
  BindU64(st.get(), 5, r.pieces);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HourBucketRecord> SqliteRepository::GetHourBucket(Transaction& t, const std::string& job_id, const std::string& date,
                                                                       uint32_t hour) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT job_id,date,hour,shippers,pieces FROM hour_buckets WHERE job_id=? AND date=? AND hour=?;");
  BindText(st.get(), 1, job_id);
  BindText(st.get(), 2, date);
  BindI32(st.get(), 3, static_cast<int>(hour));

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadBucket(st.get());
}

std::vector<model::HourBucketRecord> SqliteRepository::ListHourBuckets(Transaction& t, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT job_id,date,hour,shippers,pieces FROM hour_buckets WHERE date=? ORDER BY hour ASC, job_id ASC;");
  BindText(st.get(), 1, date);

  std::vector<model::HourBucketRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadBucket(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

std::vector<model::HourBucketRecord> SqliteRepository::ListAllHourBuckets(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT job_id,date,hour,shippers,pieces FROM hour_buckets ORDER BY job_id ASC, date ASC, hour ASC;");

  std::vector<model::HourBucketRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadBucket(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Shift stats
// ------------------------------------------------------------------

Result SqliteRepository::UpsertShiftStat(Transaction& t, const model::ShiftStatRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO shift_stats(date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(date) DO UPDATE SET total_shippers=excluded.total_shippers, total_pieces=excluded.total_pieces, "
               "total_pass=excluded.total_pass, total_fail=excluded.total_fail, jobs_completed=excluded.jobs_completed;");
  BindText(st.get(), 1, r.date);
  BindU64(st.get(), 2, r.total_shippers);
  BindU64(st.get(), 3, r.total_pieces);
  BindU64(st.get(), 4, r.total_pass);
  BindU64(st.get(), 5, r.total_fail);
  BindU64(st.get(), 6, r.jobs_completed);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ShiftStatRecord> SqliteRepository::GetShiftStat(Transaction& t, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed FROM shift_stats WHERE date=?;");
  BindText(st.get(), 1, date);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadShift(st.get());
}

std::vector<model::ShiftStatRecord> SqliteRepository::ListShiftStats(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed FROM shift_stats ORDER BY date ASC;");

  std::vector<model::ShiftStatRecord> out;
  int                                 rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadShift(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::DeleteAll(Transaction& t) {
  auto* db = TX(t).Handle();

  // children before parents for the scans -> jobs foreign key
  // scan ids restart at 1 with the ledger
  for (const char* sql : {"DELETE FROM scans;", "DELETE FROM hour_buckets;", "DELETE FROM shift_stats;", "DELETE FROM jobs;",
                          "DELETE FROM sqlite_sequence WHERE name='scans';"}) {
    Statement st(db, sql);
    int       rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

} // namespace linecheck::db::sqlite
