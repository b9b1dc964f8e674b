#include "internal/core/aggregation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace linecheck::core {

double PassRate(uint64_t pass_count, uint64_t total_scans) {
  if (total_scans == 0) {
    return 100.0;
  }
  return static_cast<double>(pass_count) / static_cast<double>(total_scans) * 100.0;
}

double PassRate(const db::model::JobRecord& job) {
  return PassRate(job.pass_count, job.total_scans);
}

double RoundPassRate(double rate) {
  return std::round(rate * 10.0) / 10.0;
}

std::chrono::seconds Elapsed(const db::model::JobRecord& job, util::TimePoint now) {
  const uint64_t end_ms = job.end_time_ms.value_or(util::ToUnixMillis(now));
  if (end_ms <= job.start_time_ms) {
    return std::chrono::seconds(0);
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds(end_ms - job.start_time_ms));
}

std::string FormatElapsed(std::chrono::seconds elapsed) {
  const auto total   = std::max<int64_t>(elapsed.count(), 0);
  const auto hours   = total / 3600;
  const auto minutes = (total % 3600) / 60;
  const auto seconds = total % 60;

  char buf[32];
  if (hours > 0) {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld", static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(seconds));
  } else {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld", static_cast<long long>(minutes), static_cast<long long>(seconds));
  }
  return buf;
}

double Progress(const db::model::JobRecord& job) {
  if (job.target_quantity <= 0) {
    return 0.0;
  }
  const double pct = static_cast<double>(job.pass_count) / static_cast<double>(job.target_quantity) * 100.0;
  return std::min(pct, 100.0);
}

void ApplyScan(db::model::JobRecord& job, bool pass) {
  ++job.total_scans;
  if (pass) {
    ++job.pass_count;
    job.total_pieces += static_cast<uint64_t>(job.pieces_per_shipper);
  } else {
    ++job.fail_count;
  }
}

db::model::ShiftStatRecord RollIntoShift(db::model::ShiftStatRecord shift, const db::model::JobRecord& job) {
  shift.total_shippers += job.pass_count;
  shift.total_pieces += job.total_pieces;
  shift.total_pass += job.pass_count;
  shift.total_fail += job.fail_count;
  shift.jobs_completed += 1;
  return shift;
}

std::vector<HourlyRow> BuildHourlyReport(const std::vector<db::model::HourBucketRecord>& buckets, uint32_t first_hour, uint32_t last_hour) {
  std::vector<HourlyRow> rows;
  if (first_hour > last_hour) {
    return rows;
  }

  rows.reserve(last_hour - first_hour + 1);
  for (uint32_t hour = first_hour; hour <= last_hour; ++hour) {
    rows.push_back(HourlyRow{.hour = hour});
  }

  for (const auto& bucket : buckets) {
    if (bucket.hour < first_hour || bucket.hour > last_hour) {
      continue;
    }
    auto& row = rows[bucket.hour - first_hour];
    row.shippers += bucket.shippers;
    row.pieces += bucket.pieces;
  }

  uint64_t running = 0;
  for (auto& row : rows) {
    running += row.pieces;
    row.cumulative_pieces = running;
  }
  return rows;
}

} // namespace linecheck::core
