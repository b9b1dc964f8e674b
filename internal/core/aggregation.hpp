#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/hour_bucket_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/shift_stat_record.hpp"
#include "internal/util/time.hpp"

namespace linecheck::core {

/*
  Derived read values. Everything here works from the cached counters;
  nothing walks the scan ledger.
*/

struct HourTotals {
  uint64_t shippers = 0;
  uint64_t pieces   = 0;
};

struct HourlyRow {
  uint32_t hour              = 0;
  uint64_t shippers          = 0;
  uint64_t pieces            = 0;
  uint64_t cumulative_pieces = 0;
};

// Percentage in [0, 100]; 100 when nothing has been scanned.
double PassRate(uint64_t pass_count, uint64_t total_scans);
double PassRate(const db::model::JobRecord& job);

// One decimal place, as shown to operators.
double RoundPassRate(double rate);

// (end_time or now) - start_time, never negative.
std::chrono::seconds Elapsed(const db::model::JobRecord& job, util::TimePoint now);

// H:MM:SS from one hour upwards, M:SS below.
std::string FormatElapsed(std::chrono::seconds elapsed);

// min(pass / target * 100, 100); 0 without a target.
double Progress(const db::model::JobRecord& job);

// Counter update for one accepted scan.
void ApplyScan(db::model::JobRecord& job, bool pass);

// Adds a finished job's totals to its day's shift row.
db::model::ShiftStatRecord RollIntoShift(db::model::ShiftStatRecord shift, const db::model::JobRecord& job);

// One row per hour in [first_hour, last_hour], summing buckets across jobs.
std::vector<HourlyRow> BuildHourlyReport(const std::vector<db::model::HourBucketRecord>& buckets, uint32_t first_hour, uint32_t last_hour);

} // namespace linecheck::core
