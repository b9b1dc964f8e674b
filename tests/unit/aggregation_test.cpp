#include "internal/core/aggregation.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

namespace {

using namespace linecheck::core;
using linecheck::db::model::HourBucketRecord;
using linecheck::db::model::JobRecord;
using linecheck::db::model::ShiftStatRecord;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestPassRate() {
  assert(Near(PassRate(0, 0), 100.0));
  assert(Near(PassRate(3, 4), 75.0));
  assert(Near(PassRate(0, 5), 0.0));
  assert(Near(RoundPassRate(PassRate(2, 3)), 66.7));
  assert(Near(RoundPassRate(PassRate(1, 3)), 33.3));
}

void TestApplyScanKeepsCountersConsistent() {
  JobRecord job;
  job.pieces_per_shipper = 12;

  ApplyScan(job, true);
  ApplyScan(job, true);
  ApplyScan(job, false);

  assert(job.total_scans == 3);
  assert(job.pass_count == 2);
  assert(job.fail_count == 1);
  assert(job.total_pieces == 24);
  assert(job.total_scans == job.pass_count + job.fail_count);
}

void TestElapsedAndFormatting() {
  const auto now = linecheck::util::FromLocal(2026, 3, 2, 10, 0, 0);

  JobRecord job;
  job.start_time_ms = linecheck::util::ToUnixMillis(now) - 3725 * 1000;
  assert(Elapsed(job, now).count() == 3725);
  assert(FormatElapsed(Elapsed(job, now)) == "1:02:05");

  job.end_time_ms = job.start_time_ms + 65 * 1000;
  assert(Elapsed(job, now).count() == 65);
  assert(FormatElapsed(Elapsed(job, now)) == "1:05");

  // clock went backwards
  job.end_time_ms = job.start_time_ms - 1000;
  assert(Elapsed(job, now).count() == 0);
  assert(FormatElapsed(std::chrono::seconds(0)) == "0:00");
}

void TestProgressIsCapped() {
  JobRecord job;
  job.pass_count = 5;
  assert(Near(Progress(job), 0.0));

  job.target_quantity = 20;
  assert(Near(Progress(job), 25.0));

  job.pass_count = 30;
  assert(Near(Progress(job), 100.0));
}

void TestRollIntoShift() {
  JobRecord job;
  job.pass_count   = 10;
  job.fail_count   = 2;
  job.total_scans  = 12;
  job.total_pieces = 60;

  ShiftStatRecord shift;
  shift.date           = "2026-03-02";
  shift.total_shippers = 4;
  shift.total_pieces   = 8;
  shift.jobs_completed = 1;

  const auto rolled = RollIntoShift(shift, job);
  assert(rolled.date == "2026-03-02");
  assert(rolled.total_shippers == 14);
  assert(rolled.total_pieces == 68);
  assert(rolled.total_pass == 10);
  assert(rolled.total_fail == 2);
  assert(rolled.jobs_completed == 2);
}

void TestHourlyReportSumsAcrossJobs() {
  std::vector<HourBucketRecord> buckets{
      {.job_id = "A", .date = "2026-03-02", .hour = 8, .shippers = 2, .pieces = 12},
      {.job_id = "B", .date = "2026-03-02", .hour = 8, .shippers = 1, .pieces = 4},
      {.job_id = "A", .date = "2026-03-02", .hour = 10, .shippers = 3, .pieces = 18},
      {.job_id = "A", .date = "2026-03-02", .hour = 22, .shippers = 9, .pieces = 99},
  };

  const auto rows = BuildHourlyReport(buckets, 8, 20);
  assert(rows.size() == 13);
  assert(rows[0].hour == 8 && rows[0].shippers == 3 && rows[0].pieces == 16 && rows[0].cumulative_pieces == 16);
  assert(rows[1].hour == 9 && rows[1].pieces == 0 && rows[1].cumulative_pieces == 16);
  assert(rows[2].hour == 10 && rows[2].shippers == 3 && rows[2].cumulative_pieces == 34);
  // hour 22 is outside the window
  assert(rows.back().hour == 20 && rows.back().cumulative_pieces == 34);

  assert(BuildHourlyReport(buckets, 12, 11).empty());
}

} // namespace

int main() {
  TestPassRate();
  TestApplyScanKeepsCountersConsistent();
  TestElapsedAndFormatting();
  TestProgressIsCapped();
  TestRollIntoShift();
  TestHourlyReportSumsAcrossJobs();

  std::cout << "linecheck_unit_aggregation: pass\n";
  return 0;
}
