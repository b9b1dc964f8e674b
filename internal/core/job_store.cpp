#include "internal/core/job_store.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "internal/core/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace linecheck::core {

namespace {

using linecheck::db::ErrorCode;
using linecheck::db::Result;
using linecheck::observability::BoolField;
using linecheck::observability::IntField;
using linecheck::observability::StringField;

constexpr uint64_t kDefaultPageSize = 20;
constexpr uint64_t kMaxPageSize     = 100;

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::ConflictError(message);
    case ErrorCode::NotFound:
      throw util::NotFoundError(message);
    default:
      throw util::PersistenceError(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace

JobStore::JobStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock, std::size_t recent_window)
    : repository_(std::move(repository)), clock_(std::move(clock)), recent_window_(recent_window == 0 ? 1 : recent_window) {
  if (!repository_) {
    throw std::invalid_argument("JobStore requires a repository");
  }
  if (!clock_) {
    clock_ = std::make_shared<util::SystemTimeSource>();
  }
}

std::unique_ptr<db::Transaction> JobStore::Begin(const char* context) {
  try {
    return repository_->Begin();
  } catch (const std::exception& ex) {
    throw util::PersistenceError(std::string(context) + ": begin failed: " + ex.what());
  }
}

void JobStore::Commit(db::Transaction& tx, const char* context) {
  try {
    tx.Commit();
  } catch (const std::exception& ex) {
    throw util::PersistenceError(std::string(context) + ": commit failed: " + ex.what());
  }
}

void JobStore::Hydrate() {
  const auto today = util::LocalDate(clock_->Now());

  auto tx      = Begin("hydrate");
  auto active  = repository_->GetActiveJob(*tx);
  auto current = active ? active : CurrentJob(*tx);

  std::vector<db::model::ScanRecord> recent;
  if (active) {
    recent = repository_->ListRecentScans(*tx, active->job_id, recent_window_);
  }
  if (!repository_->GetShiftStat(*tx, today)) {
    db::model::ShiftStatRecord shift;
    shift.date = today;
    ThrowIfDbError(repository_->UpsertShiftStat(*tx, shift), "hydrate: create shift row");
  }
  Commit(*tx, "hydrate");

  std::unique_lock lock(cache_mutex_);
  active_      = std::move(active);
  line_locked_ = current && current->is_locked;
  recent_.assign(recent.begin(), recent.end());

  LINECHECK_LOG_INFO("job cache hydrated", {StringField("active_job", active_ ? active_->job_id : std::string("none")),
                                             IntField("recent_scans", static_cast<int64_t>(recent_.size())), StringField("shift_date", today),
                                             BoolField("line_locked", line_locked_)});
}

std::optional<db::model::JobRecord> JobStore::CurrentJob(db::Transaction& tx) {
  if (auto active = repository_->GetActiveJob(tx)) {
    return active;
  }
  auto newest = repository_->ListJobs(tx, 0, 1);
  if (newest.empty()) {
    return std::nullopt;
  }
  return newest.front();
}

bool JobStore::LineLocked() const {
  std::shared_lock lock(cache_mutex_);
  return line_locked_;
}

void JobStore::SetLineLocked(bool locked) {
  auto tx      = Begin("line lock");
  auto current = CurrentJob(*tx);
  if (current && current->is_locked != locked) {
    current->is_locked = locked;
    ThrowIfDbError(repository_->UpdateJob(*tx, *current), "line lock");
  }
  Commit(*tx, "line lock");

  std::unique_lock lock(cache_mutex_);
  line_locked_ = current && locked;
  if (current && active_ && active_->job_id == current->job_id) {
    active_->is_locked = locked;
  }
}

std::string JobStore::GenerateJobId(db::Transaction& tx, util::TimePoint now) {
  const auto base      = "JOB_" + util::LocalCompactStamp(now);
  auto       candidate = base;
  for (int suffix = 2; repository_->GetJob(tx, candidate).has_value(); ++suffix) {
    candidate = base + "_" + std::to_string(suffix);
  }
  return candidate;
}

db::model::JobRecord JobStore::StartJob(const JobSpec& spec) {
  const auto trimmed_id = Trim(spec.job_id);
  const auto job_id     = trimmed_id.empty() ? std::string() : ValidateJobId(trimmed_id);
  const auto expected   = ValidateExpectedBarcode(spec.expected_barcode);
  const auto pieces     = spec.pieces_per_shipper.value_or(1);
  ValidatePiecesPerShipper(pieces);
  ValidateTargetQuantity(spec.target_quantity);

  const auto now = clock_->Now();

  auto tx = Begin("start job");
  if (auto active = repository_->GetActiveJob(*tx)) {
    throw util::ConflictError("job '" + active->job_id + "' is already active; end it first");
  }

  db::model::JobRecord record;
  if (job_id.empty()) {
    record.job_id = GenerateJobId(*tx, now);
  } else {
    if (repository_->GetJob(*tx, job_id)) {
      throw util::ConflictError("job id '" + job_id + "' already exists");
    }
    record.job_id = job_id;
  }
  record.expected_barcode   = expected;
  record.pieces_per_shipper = pieces;
  record.target_quantity    = spec.target_quantity;
  record.start_time_ms      = util::ToUnixMillis(now);
  record.is_active          = true;
  record.is_locked          = spec.line_locked;

  ThrowIfDbError(repository_->InsertJob(*tx, record), "start job");
  Commit(*tx, "start job");

  {
    std::unique_lock lock(cache_mutex_);
    active_      = record;
    line_locked_ = record.is_locked;
    recent_.clear();
  }

  LINECHECK_LOG_INFO("job started", {StringField("job_id", record.job_id), StringField("expected_barcode", record.expected_barcode),
                                     IntField("pieces_per_shipper", record.pieces_per_shipper), IntField("target_quantity", record.target_quantity)});
  return record;
}

db::model::ScanRecord JobStore::RecordScan(const std::string& barcode, linecheck::v1::ScanStatus status) {
  auto current = ActiveJob();
  if (!current) {
    throw util::NoActiveJobError("no active job; start a job before scanning");
  }

  const auto now  = clock_->Now();
  const bool pass = status == linecheck::v1::SCAN_STATUS_PASS;

  db::model::ScanRecord scan;
  scan.job_id       = current->job_id;
  scan.barcode      = barcode;
  scan.expected     = current->expected_barcode;
  scan.status       = status;
  scan.timestamp_ms = util::ToUnixMillis(now);

  auto updated = *current;
  ApplyScan(updated, pass);
  if (!pass) {
    updated.is_locked = true;
  }

  auto tx = Begin("record scan");
  ThrowIfDbError(repository_->InsertScan(*tx, scan), "record scan");
  ThrowIfDbError(repository_->UpdateJob(*tx, updated), "record scan: update counters");
  if (pass) {
    db::model::HourBucketRecord delta;
    delta.job_id   = updated.job_id;
    delta.date     = util::LocalDate(now);
    delta.hour     = static_cast<uint32_t>(util::LocalHour(now));
    delta.shippers = 1;
    delta.pieces   = static_cast<uint64_t>(updated.pieces_per_shipper);
    ThrowIfDbError(repository_->IncrementHourBucket(*tx, delta), "record scan: hour bucket");
  }
  Commit(*tx, "record scan");

  std::unique_lock lock(cache_mutex_);
  active_      = updated;
  line_locked_ = updated.is_locked;
  recent_.push_front(scan);
  while (recent_.size() > recent_window_) {
    recent_.pop_back();
  }
  return scan;
}

EndedJob JobStore::EndJob() {
  auto current = ActiveJob();
  if (!current) {
    throw util::NotFoundError("no active job to end");
  }

  const auto now = clock_->Now();

  EndedJob ended;
  ended.job             = *current;
  ended.job.end_time_ms = util::ToUnixMillis(now);
  ended.job.is_active   = false;

  const auto date = util::LocalDate(now);

  auto tx = Begin("end job");
  ThrowIfDbError(repository_->UpdateJob(*tx, ended.job), "end job");
  db::model::ShiftStatRecord shift;
  shift.date = date;
  if (auto existing = repository_->GetShiftStat(*tx, date)) {
    shift = *existing;
  }
  ended.shift = RollIntoShift(shift, ended.job);
  ThrowIfDbError(repository_->UpsertShiftStat(*tx, ended.shift), "end job: shift totals");
  Commit(*tx, "end job");

  {
    std::unique_lock lock(cache_mutex_);
    active_.reset();
    recent_.clear();
  }

  LINECHECK_LOG_INFO("job ended", {StringField("job_id", ended.job.job_id), IntField("total_scans", static_cast<int64_t>(ended.job.total_scans)),
                                   IntField("pass_count", static_cast<int64_t>(ended.job.pass_count)),
                                   IntField("fail_count", static_cast<int64_t>(ended.job.fail_count)), StringField("shift_date", date)});
  return ended;
}

std::optional<db::model::JobRecord> JobStore::ActiveJob() const {
  std::shared_lock lock(cache_mutex_);
  return active_;
}

std::vector<db::model::ScanRecord> JobStore::RecentScans() const {
  std::shared_lock lock(cache_mutex_);
  return {recent_.begin(), recent_.end()};
}

HourTotals JobStore::JobHourTotals(const std::string& job_id, util::TimePoint at, int hour_offset) {
  const int hour = util::LocalHour(at) + hour_offset;
  if (hour < 0 || hour > 23) {
    return {};
  }

  auto tx     = Begin("hour totals");
  auto bucket = repository_->GetHourBucket(*tx, job_id, util::LocalDate(at), static_cast<uint32_t>(hour));
  Commit(*tx, "hour totals");
  if (!bucket) {
    return {};
  }
  return HourTotals{bucket->shippers, bucket->pieces};
}

db::model::ShiftStatRecord JobStore::ShiftFor(const std::string& date) {
  auto tx    = Begin("shift totals");
  auto shift = repository_->GetShiftStat(*tx, date);
  Commit(*tx, "shift totals");
  if (shift) {
    return *shift;
  }
  db::model::ShiftStatRecord empty;
  empty.date = date;
  return empty;
}

std::vector<db::model::HourBucketRecord> JobStore::HourBuckets(const std::string& date) {
  auto tx      = Begin("hour buckets");
  auto buckets = repository_->ListHourBuckets(*tx, date);
  Commit(*tx, "hour buckets");
  return buckets;
}

std::optional<db::model::JobRecord> JobStore::FindJob(const std::string& job_id) {
  auto tx  = Begin("get job");
  auto job = repository_->GetJob(*tx, job_id);
  Commit(*tx, "get job");
  return job;
}

std::vector<db::model::ScanRecord> JobStore::JobScans(const std::string& job_id, uint64_t limit) {
  if (limit == 0 || limit > kMaxJobScanRows) {
    limit = kMaxJobScanRows;
  }
  auto tx    = Begin("job scans");
  auto scans = repository_->ListRecentScans(*tx, job_id, limit);
  Commit(*tx, "job scans");
  return scans;
}

JobPage JobStore::ListJobs(uint64_t page, uint64_t page_size) {
  if (page == 0) {
    page = 1;
  }
  if (page_size == 0) {
    page_size = kDefaultPageSize;
  }
  page_size = std::min(page_size, kMaxPageSize);

  JobPage out;
  out.page      = page;
  out.page_size = page_size;

  auto tx   = Begin("list jobs");
  out.total = repository_->CountJobs(*tx);
  out.jobs  = repository_->ListJobs(*tx, (page - 1) * page_size, page_size);
  Commit(*tx, "list jobs");
  return out;
}

StateData JobStore::Export() {
  StateData data;
  auto      tx      = Begin("export state");
  data.jobs         = repository_->ListJobs(*tx, 0, repository_->CountJobs(*tx));
  data.scans        = repository_->ListAllScans(*tx);
  data.hour_buckets = repository_->ListAllHourBuckets(*tx);
  data.shift_stats  = repository_->ListShiftStats(*tx);
  Commit(*tx, "export state");

  std::sort(data.jobs.begin(), data.jobs.end(), [](const auto& a, const auto& b) { return a.job_id < b.job_id; });
  return data;
}

void JobStore::Replace(const StateData& data) {
  auto tx = Begin("import state");
  ThrowIfDbError(repository_->DeleteAll(*tx), "import state: clear");
  for (const auto& job : data.jobs) {
    ThrowIfDbError(repository_->InsertJob(*tx, job), "import state: job " + job.job_id);
  }
  for (auto scan : data.scans) {
    ThrowIfDbError(repository_->InsertScan(*tx, scan), "import state: scan " + std::to_string(scan.id));
  }
  for (const auto& bucket : data.hour_buckets) {
    ThrowIfDbError(repository_->InsertHourBucket(*tx, bucket), "import state: hour bucket " + bucket.job_id);
  }
  for (const auto& shift : data.shift_stats) {
    ThrowIfDbError(repository_->UpsertShiftStat(*tx, shift), "import state: shift " + shift.date);
  }

  std::optional<db::model::JobRecord> active  = repository_->GetActiveJob(*tx);
  std::optional<db::model::JobRecord> current = active ? active : CurrentJob(*tx);
  std::vector<db::model::ScanRecord>  recent;
  if (active) {
    recent = repository_->ListRecentScans(*tx, active->job_id, recent_window_);
  }
  Commit(*tx, "import state");

  std::unique_lock lock(cache_mutex_);
  active_      = std::move(active);
  line_locked_ = current && current->is_locked;
  recent_.assign(recent.begin(), recent.end());
}

} // namespace linecheck::core
