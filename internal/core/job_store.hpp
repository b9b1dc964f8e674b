#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/core/aggregation.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace linecheck::core {

struct JobSpec {
  std::string            job_id; // empty: generated from the start time
  std::string            expected_barcode;
  std::optional<int64_t> pieces_per_shipper;
  int64_t                target_quantity = 0;
  bool                   line_locked     = false; // carried onto the new job row
};

struct EndedJob {
  db::model::JobRecord       job;
  db::model::ShiftStatRecord shift;
};

struct JobPage {
  std::vector<db::model::JobRecord> jobs;
  uint64_t                          total     = 0;
  uint64_t                          page      = 1; // normalized, 1-based
  uint64_t                          page_size = 0; // normalized, at most 100
};

// Full persisted state, in repository order.
struct StateData {
  std::vector<db::model::JobRecord>        jobs;
  std::vector<db::model::ScanRecord>       scans;
  std::vector<db::model::HourBucketRecord> hour_buckets;
  std::vector<db::model::ShiftStatRecord>  shift_stats;
};

inline constexpr uint64_t kMaxJobScanRows = 100;

/*
  JobStore

  Owns the active job cache and the recent scan window over a Repository.
  Every mutation is one transaction; the cache changes only after the
  commit returns. A FAIL scan marks the job row locked in the same
  transaction, so the line lock outlives the process. Callers serialize writers (LineService holds the
  exclusive section); the cache mutex only protects readers.

  Repository failures surface as util::PersistenceError, active-job and
  duplicate-id constraint failures as util::ConflictError.
*/
class JobStore {
 public:
  JobStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock, std::size_t recent_window = 8);

  // Reloads the cache from the repository and creates today's shift row.
  void Hydrate();

  // Persisted line lock of the current job (the active one, else the newest).
  bool LineLocked() const;
  // Writes the line lock onto the current job row. No-op without jobs.
  void SetLineLocked(bool locked);

  db::model::JobRecord  StartJob(const JobSpec& spec);
  db::model::ScanRecord RecordScan(const std::string& barcode, linecheck::v1::ScanStatus status);
  EndedJob              EndJob();

  std::optional<db::model::JobRecord> ActiveJob() const;
  // Most recent first.
  std::vector<db::model::ScanRecord> RecentScans() const;

  // Bucket of the active job at the given local date/hour; zero when absent.
  HourTotals JobHourTotals(const std::string& job_id, util::TimePoint at, int hour_offset = 0);

  db::model::ShiftStatRecord                 ShiftFor(const std::string& date);
  std::vector<db::model::HourBucketRecord>   HourBuckets(const std::string& date);
  std::optional<db::model::JobRecord>        FindJob(const std::string& job_id);
  std::vector<db::model::ScanRecord>         JobScans(const std::string& job_id, uint64_t limit);
  // Newest first; page 0 reads as 1, page_size 0 as 20.
  JobPage                                    ListJobs(uint64_t page, uint64_t page_size);

  StateData Export();
  // Destructive: the repository ends up holding exactly `data`.
  void Replace(const StateData& data);

  std::size_t RecentWindow() const {
    return recent_window_;
  }
  const std::shared_ptr<util::TimeSource>& Clock() const {
    return clock_;
  }

 private:
  std::unique_ptr<db::Transaction> Begin(const char* context);
  void                             Commit(db::Transaction& tx, const char* context);
  std::string                      GenerateJobId(db::Transaction& tx, util::TimePoint now);
  std::optional<db::model::JobRecord> CurrentJob(db::Transaction& tx);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;
  const std::size_t                 recent_window_;

  mutable std::shared_mutex             cache_mutex_;
  std::optional<db::model::JobRecord>   active_;
  std::deque<db::model::ScanRecord>     recent_;
  bool                                  line_locked_ = false;
};

} // namespace linecheck::core
