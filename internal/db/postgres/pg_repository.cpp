#include "pg_repository.hpp"

#include <cstring>
#include <stdexcept>

namespace linecheck::db::postgres {

namespace {

constexpr const char* kJobColumns =
    "job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,"
    "total_scans,pass_count,fail_count,total_pieces,is_locked";

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.job_id             = row[0].c_str();
  r.expected_barcode   = row[1].c_str();
  r.pieces_per_shipper = row[2].as<int64_t>();
  r.target_quantity    = row[3].as<int64_t>();
  r.start_time_ms      = row[4].as<uint64_t>();
  if (!row[5].is_null()) {
    r.end_time_ms = row[5].as<uint64_t>();
  }
  r.is_active    = row[6].as<bool>();
  r.total_scans  = row[7].as<uint64_t>();
  r.pass_count   = row[8].as<uint64_t>();
  r.fail_count   = row[9].as<uint64_t>();
  r.total_pieces = row[10].as<uint64_t>();
  r.is_locked    = row[11].as<bool>();
  return r;
}

model::ScanRecord ReadScan(const pqxx::row& row) {
  model::ScanRecord r;
  r.id           = row[0].as<uint64_t>();
  r.job_id       = row[1].c_str();
  r.barcode      = row[2].c_str();
  r.expected     = row[3].c_str();
  r.status       = static_cast<linecheck::v1::ScanStatus>(row[4].as<int>());
  r.timestamp_ms = row[5].as<uint64_t>();
  return r;
}

model::HourBucketRecord ReadBucket(const pqxx::row& row) {
  model::HourBucketRecord r;
  r.job_id   = row[0].c_str();
  r.date     = row[1].c_str();
  r.hour     = static_cast<uint32_t>(row[2].as<int>());
  r.shippers = row[3].as<uint64_t>();
  r.pieces   = row[4].as<uint64_t>();
  return r;
}

model::ShiftStatRecord ReadShift(const pqxx::row& row) {
  model::ShiftStatRecord r;
  r.date           = row[0].c_str();
  r.total_shippers = row[1].as<uint64_t>();
  r.total_pieces   = row[2].as<uint64_t>();
  r.total_pass     = row[3].as<uint64_t>();
  r.total_fail     = row[4].as<uint64_t>();
  r.jobs_completed = row[5].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(*pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    // the single-active partial index is the only non-key unique constraint
    if (std::strstr(e.what(), "jobs_single_active") != nullptr) {
      return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO jobs(job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,"
        "total_scans,pass_count,fail_count,total_pieces,is_locked) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12);",
        r.job_id, r.expected_barcode, r.pieces_per_shipper, r.target_quantity, r.start_time_ms, r.end_time_ms, r.is_active, r.total_scans,
        r.pass_count, r.fail_count, r.total_pieces, r.is_locked);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE jobs SET expected_barcode=$2,pieces_per_shipper=$3,target_quantity=$4,start_time_ms=$5,end_time_ms=$6,is_active=$7,"
        "total_scans=$8,pass_count=$9,fail_count=$10,total_pieces=$11,is_locked=$12 WHERE job_id=$1;",
        r.job_id, r.expected_barcode, r.pieces_per_shipper, r.target_quantity, r.start_time_ms, r.end_time_ms, r.is_active, r.total_scans,
        r.pass_count, r.fail_count, r.total_pieces, r.is_locked);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "job " + r.job_id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& job_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE job_id=$1;", job_id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::GetActiveJob(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kJobColumns + " FROM jobs WHERE is_active LIMIT 1;");
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, uint64_t offset, uint64_t limit) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kJobColumns + " FROM jobs ORDER BY start_time_ms DESC, job_id DESC LIMIT $1 OFFSET $2;", limit, offset);

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row));
  return out;
}

uint64_t PgRepository::CountJobs(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM jobs;");
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Scan ledger
// ------------------------------------------------------------------

Result PgRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  try {
    auto& work = TX(t).Work();
    if (r.id == 0) {
      auto res = work.exec_params("INSERT INTO scans(job_id,barcode,expected,status,timestamp_ms) VALUES($1,$2,$3,$4,$5) RETURNING id;",
                                  r.job_id, r.barcode, r.expected, static_cast<int>(r.status), r.timestamp_ms);
      r.id = res[0][0].as<uint64_t>();
    } else {
      work.exec_params("INSERT INTO scans(id,job_id,barcode,expected,status,timestamp_ms) VALUES($1,$2,$3,$4,$5,$6);", r.id, r.job_id,
                       r.barcode, r.expected, static_cast<int>(r.status), r.timestamp_ms);
      // keep generated ids ahead of imported ones
      work.exec("SELECT setval(pg_get_serial_sequence('scans','id'), GREATEST((SELECT MAX(id) FROM scans), 1));");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ScanRecord> PgRepository::ListRecentScans(Transaction& t, const std::string& job_id, uint64_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans WHERE job_id=$1 ORDER BY id DESC LIMIT $2;", job_id, limit);

  std::vector<model::ScanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadScan(row));
  return out;
}

std::vector<model::ScanRecord> PgRepository::ListAllScans(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans ORDER BY id ASC;");

  std::vector<model::ScanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadScan(row));
  return out;
}

// ------------------------------------------------------------------
// Hour buckets
// ------------------------------------------------------------------

Result PgRepository::IncrementHourBucket(Transaction& t, const model::HourBucketRecord& delta) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO hour_buckets(job_id,date,hour,shippers,pieces) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(job_id,date,hour) DO UPDATE SET shippers=hour_buckets.shippers+EXCLUDED.shippers, "
        "pieces=hour_buckets.pieces+EXCLUDED.pieces;",
        delta.job_id, delta.date, static_cast<int>(delta.hour), delta.shippers, delta.pieces);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertHourBucket(Transaction& t, const model::HourBucketRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO hour_buckets(job_id,date,hour,shippers,pieces) VALUES($1,$2,$3,$4,$5);", r.job_id, r.date,
                             static_cast<int>(r.hour), r.shippers, r.pieces);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HourBucketRecord> PgRepository::GetHourBucket(Transaction& t, const std::string& job_id, const std::string& date,
                                                                   uint32_t hour) {
  auto res = TX(t).Work().exec_params("SELECT job_id,date,hour,shippers,pieces FROM hour_buckets WHERE job_id=$1 AND date=$2 AND hour=$3;",
                                      job_id, date, static_cast<int>(hour));
  if (res.empty()) return std::nullopt;
  return ReadBucket(res[0]);
}

std::vector<model::HourBucketRecord> PgRepository::ListHourBuckets(Transaction& t, const std::string& date) {
  auto res =
      TX(t).Work().exec_params("SELECT job_id,date,hour,shippers,pieces FROM hour_buckets WHERE date=$1 ORDER BY hour ASC, job_id ASC;", date);

  std::vector<model::HourBucketRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBucket(row));
  return out;
}

std::vector<model::HourBucketRecord> PgRepository::ListAllHourBuckets(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT job_id,date,hour,shippers,pieces FROM hour_buckets ORDER BY job_id ASC, date ASC, hour ASC;");

  std::vector<model::HourBucketRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBucket(row));
  return out;
}

// ------------------------------------------------------------------
// Shift stats
// ------------------------------------------------------------------

Result PgRepository::UpsertShiftStat(Transaction& t, const model::ShiftStatRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO shift_stats(date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(date) DO UPDATE SET total_shippers=EXCLUDED.total_shippers, total_pieces=EXCLUDED.total_pieces, "
        "total_pass=EXCLUDED.total_pass, total_fail=EXCLUDED.total_fail, jobs_completed=EXCLUDED.jobs_completed;",
        r.date, r.total_shippers, r.total_pieces, r.total_pass, r.total_fail, r.jobs_completed);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ShiftStatRecord> PgRepository::GetShiftStat(Transaction& t, const std::string& date) {
  auto res = TX(t).Work().exec_params(
      "SELECT date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed FROM shift_stats WHERE date=$1;", date);
  if (res.empty()) return std::nullopt;
  return ReadShift(res[0]);
}

std::vector<model::ShiftStatRecord> PgRepository::ListShiftStats(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT date,total_shippers,total_pieces,total_pass,total_fail,jobs_completed FROM shift_stats ORDER BY date ASC;");

  std::vector<model::ShiftStatRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadShift(row));
  return out;
}

Result PgRepository::DeleteAll(Transaction& t) {
  try {
    TX(t).Work().exec("TRUNCATE scans, hour_buckets, shift_stats, jobs RESTART IDENTITY;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace linecheck::db::postgres
