#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/hour_bucket_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/scan_record.hpp"
#include "internal/db/model/shift_stat_record.hpp"

namespace linecheck::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - At most one job row has is_active = true (InsertJob/UpdateJob
    return ConstraintViolation otherwise)
  - Scans are append-only; the only removal path is DeleteAll, used by
    a destructive state import

  The DB is the source of truth for:
    jobs and their cached counters
    the scan ledger
    hour buckets and shift rows
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) = 0;

  virtual std::optional<model::JobRecord> GetActiveJob(Transaction&) = 0;

  // Newest first (start time, then job id, descending).
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, uint64_t offset, uint64_t limit) = 0;

  virtual uint64_t CountJobs(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Scan ledger
  // ---------------------------------------------------------------------

  // Assigns r.id when it is 0.
  virtual Result InsertScan(Transaction&, model::ScanRecord& r) = 0;

  // Most recent first, at most `limit` rows.
  virtual std::vector<model::ScanRecord> ListRecentScans(Transaction&, const std::string& job_id, uint64_t limit) = 0;

  // Every scan, ascending id.
  virtual std::vector<model::ScanRecord> ListAllScans(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Hour buckets
  // ---------------------------------------------------------------------

  // Adds to the bucket, creating it at zero first.
  virtual Result IncrementHourBucket(Transaction&, const model::HourBucketRecord& delta) = 0;

  virtual Result InsertHourBucket(Transaction&, const model::HourBucketRecord&) = 0;

  virtual std::optional<model::HourBucketRecord> GetHourBucket(Transaction&, const std::string& job_id, const std::string& date, uint32_t hour) = 0;

  virtual std::vector<model::HourBucketRecord> ListHourBuckets(Transaction&, const std::string& date) = 0;

  virtual std::vector<model::HourBucketRecord> ListAllHourBuckets(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Shift stats
  // ---------------------------------------------------------------------

  virtual Result UpsertShiftStat(Transaction&, const model::ShiftStatRecord&) = 0;

  virtual std::optional<model::ShiftStatRecord> GetShiftStat(Transaction&, const std::string& date) = 0;

  // Ascending date.
  virtual std::vector<model::ShiftStatRecord> ListShiftStats(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Import
  // ---------------------------------------------------------------------

  virtual Result DeleteAll(Transaction&) = 0;
};

} // namespace linecheck::db
