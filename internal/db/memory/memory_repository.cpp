#include "memory_repository.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>

#include "memory_tx.hpp"

namespace linecheck::db::memory {

namespace {

bool NewestFirst(const model::JobRecord& a, const model::JobRecord& b) {
  if (a.start_time_ms != b.start_time_ms) return a.start_time_ms > b.start_time_ms;
  return a.job_id > b.job_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

template <typename Map>
MemoryRepository::Undo MemoryRepository::RestoreRow(Map State::*table, const Map& current, const typename Map::key_type& key) {
  auto it = current.find(key);
  if (it == current.end()) {
    return [table, key](State& s) { (s.*table).erase(key); };
  }
  return [table, key, prior = it->second](State& s) { (s.*table)[key] = prior; };
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  const auto& view = TX(t).View();
  if (view.jobs.contains(r.job_id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.job_id + " already exists");
  if (r.is_active) {
    for (const auto& [_, job] : view.jobs) {
      if (job.is_active) return Result::Err(ErrorCode::ConstraintViolation, "job " + job.job_id + " is already active");
    }
  }
  TX(t).Mutable(RestoreRow(&State::jobs, view.jobs, r.job_id)).jobs[r.job_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.jobs.find(r.job_id);
  if (it == view.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.job_id + " not found");
  if (r.is_active) {
    for (const auto& [id, job] : view.jobs) {
      if (job.is_active && id != r.job_id) return Result::Err(ErrorCode::ConstraintViolation, "job " + id + " is already active");
    }
  }
  TX(t).Mutable(RestoreRow(&State::jobs, view.jobs, r.job_id)).jobs[r.job_id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::GetActiveJob(Transaction& t) {
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.is_active) return job;
  }
  return std::nullopt;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, uint64_t offset, uint64_t limit) {
  std::vector<model::JobRecord> all;
  for (const auto& [_, job] : TX(t).View().jobs) all.push_back(job);
  std::sort(all.begin(), all.end(), NewestFirst);

  std::vector<model::JobRecord> out;
  for (uint64_t i = offset; i < all.size() && out.size() < limit; ++i) out.push_back(all[i]);
  return out;
}

uint64_t MemoryRepository::CountJobs(Transaction& t) {
  return TX(t).View().jobs.size();
}

// ------------------------------------------------------------------
// Scan ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  const auto& view = TX(t).View();
  if (!view.jobs.contains(r.job_id)) return Result::Err(ErrorCode::ConstraintViolation, "scan references unknown job " + r.job_id);

  // ledger stays ordered by id
  const auto by_id = [](uint64_t id, const model::ScanRecord& e) { return id < e.id; };
  const auto id    = r.id == 0 ? view.next_scan_id : r.id;
  if (r.id != 0) {
    auto at = std::lower_bound(view.scans.begin(), view.scans.end(), r.id, [](const model::ScanRecord& e, uint64_t v) { return e.id < v; });
    if (at != view.scans.end() && at->id == r.id) return Result::Err(ErrorCode::AlreadyExists, "scan id " + std::to_string(r.id) + " already exists");
  }

  auto& s = TX(t).Mutable([id, by_id, next = view.next_scan_id](State& undo) {
    auto pos = std::upper_bound(undo.scans.begin(), undo.scans.end(), id, by_id);
    undo.scans.erase(std::prev(pos));
    undo.next_scan_id = next;
  });
  r.id           = id;
  s.next_scan_id = std::max(s.next_scan_id, id + 1);
  s.scans.insert(std::upper_bound(s.scans.begin(), s.scans.end(), id, by_id), r);
  return Result::Ok();
}

std::vector<model::ScanRecord> MemoryRepository::ListRecentScans(Transaction& t, const std::string& job_id, uint64_t limit) {
  std::vector<model::ScanRecord> out;
  const auto&                    scans = TX(t).View().scans;
  for (auto it = scans.rbegin(); it != scans.rend() && out.size() < limit; ++it) {
    if (it->job_id == job_id) out.push_back(*it);
  }
  return out;
}

std::vector<model::ScanRecord> MemoryRepository::ListAllScans(Transaction& t) {
  return TX(t).View().scans;
}

// ------------------------------------------------------------------
// Hour buckets
// ------------------------------------------------------------------

Result MemoryRepository::IncrementHourBucket(Transaction& t, const model::HourBucketRecord& delta) {
  const BucketKey key{delta.job_id, delta.date, delta.hour};
  auto&           s   = TX(t).Mutable(RestoreRow(&State::hour_buckets, TX(t).View().hour_buckets, key));
  auto&           row = s.hour_buckets[key];
  row.job_id = delta.job_id;
  row.date   = delta.date;
  row.hour   = delta.hour;
  row.shippers += delta.shippers;
  row.pieces += delta.pieces;
  return Result::Ok();
}

Result MemoryRepository::InsertHourBucket(Transaction& t, const model::HourBucketRecord& r) {
  const BucketKey key{r.job_id, r.date, r.hour};
  const auto&     view = TX(t).View();
  if (view.hour_buckets.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "hour bucket already exists");
  }
  TX(t).Mutable(RestoreRow(&State::hour_buckets, view.hour_buckets, key)).hour_buckets.emplace(key, r);
  return Result::Ok();
}

std::optional<model::HourBucketRecord> MemoryRepository::GetHourBucket(Transaction& t, const std::string& job_id, const std::string& date,
                                                                       uint32_t hour) {
  const auto& s  = TX(t).View();
  auto        it = s.hour_buckets.find({job_id, date, hour});
  if (it == s.hour_buckets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::HourBucketRecord> MemoryRepository::ListHourBuckets(Transaction& t, const std::string& date) {
  std::vector<model::HourBucketRecord> out;
  for (const auto& [_, row] : TX(t).View().hour_buckets) {
    if (row.date == date) out.push_back(row);
  }
  return out;
}

std::vector<model::HourBucketRecord> MemoryRepository::ListAllHourBuckets(Transaction& t) {
  std::vector<model::HourBucketRecord> out;
  for (const auto& [_, row] : TX(t).View().hour_buckets) out.push_back(row);
  return out;
}

// ------------------------------------------------------------------
// Shift stats
// ------------------------------------------------------------------

Result MemoryRepository::UpsertShiftStat(Transaction& t, const model::ShiftStatRecord& r) {
  TX(t).Mutable(RestoreRow(&State::shift_stats, TX(t).View().shift_stats, r.date)).shift_stats[r.date] = r;
  return Result::Ok();
}

std::optional<model::ShiftStatRecord> MemoryRepository::GetShiftStat(Transaction& t, const std::string& date) {
  const auto& s  = TX(t).View();
  auto        it = s.shift_stats.find(date);
  if (it == s.shift_stats.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ShiftStatRecord> MemoryRepository::ListShiftStats(Transaction& t) {
  std::vector<model::ShiftStatRecord> out;
  for (const auto& [_, row] : TX(t).View().shift_stats) out.push_back(row);
  return out;
}

Result MemoryRepository::DeleteAll(Transaction& t) {
  auto prior = std::make_shared<State>();
  auto& s    = TX(t).Mutable([prior](State& undo) { undo = std::move(*prior); });
  *prior     = std::exchange(s, State{});
  return Result::Ok();
}

} // namespace linecheck::db::memory
