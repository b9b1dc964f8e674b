#include "admin_service.hpp"

#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <tuple>

#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/core/job_store.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/lock/line_lock_guard.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace linecheck::service {

using namespace linecheck::v1;
using linecheck::observability::IntField;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.jobs || !ctx_.guard || !ctx_.hub || !ctx_.clock || !ctx_.line_mutex) {
    throw std::invalid_argument("AdminService requires jobs, guard, hub, clock and line mutex");
  }
}

void ValidateSnapshot(const StateSnapshot& snapshot) {
  if (snapshot.format_version() > kSnapshotFormatVersion) {
    throw util::ValidationError("snapshot format_version " + std::to_string(snapshot.format_version()) + " is newer than supported version " +
                                std::to_string(kSnapshotFormatVersion));
  }

  std::map<std::string, const Job*> jobs;
  int                               active = 0;
  for (const auto& job : snapshot.jobs()) {
    if (job.job_id().empty()) {
      throw util::ValidationError("snapshot job with empty job_id");
    }
    if (!jobs.emplace(job.job_id(), &job).second) {
      throw util::ValidationError("snapshot job '" + job.job_id() + "' appears twice");
    }
    if (job.is_active()) {
      ++active;
    }
    if (job.pieces_per_shipper() < 1) {
      throw util::ValidationError("snapshot job '" + job.job_id() + "': pieces_per_shipper must be positive");
    }
    if (job.total_scans() != job.pass_count() + job.fail_count()) {
      throw util::ValidationError("snapshot job '" + job.job_id() + "': total_scans != pass_count + fail_count");
    }
    if (job.total_pieces() != job.pass_count() * static_cast<uint64_t>(job.pieces_per_shipper())) {
      throw util::ValidationError("snapshot job '" + job.job_id() + "': total_pieces != pass_count * pieces_per_shipper");
    }
  }
  if (active > 1) {
    throw util::ValidationError("snapshot has " + std::to_string(active) + " active jobs; at most one allowed");
  }

  std::set<uint64_t> scan_ids;
  for (const auto& scan : snapshot.scans()) {
    if (scan.id() == 0 || !scan_ids.insert(scan.id()).second) {
      throw util::ValidationError("snapshot scan id " + std::to_string(scan.id()) + " is zero or duplicated");
    }
    if (!jobs.contains(scan.job_id())) {
      throw util::ValidationError("snapshot scan " + std::to_string(scan.id()) + " references unknown job '" + scan.job_id() + "'");
    }
    if (scan.status() != SCAN_STATUS_PASS && scan.status() != SCAN_STATUS_FAIL) {
      throw util::ValidationError("snapshot scan " + std::to_string(scan.id()) + " has no PASS/FAIL status");
    }
  }

  std::set<std::tuple<std::string, std::string, uint32_t>> bucket_keys;
  for (const auto& bucket : snapshot.hour_buckets()) {
    if (!jobs.contains(bucket.job_id())) {
      throw util::ValidationError("snapshot hour bucket references unknown job '" + bucket.job_id() + "'");
    }
    if (bucket.hour() > 23) {
      throw util::ValidationError("snapshot hour bucket for '" + bucket.job_id() + "' has hour " + std::to_string(bucket.hour()));
    }
    if (!bucket_keys.emplace(bucket.job_id(), bucket.date(), bucket.hour()).second) {
      throw util::ValidationError("snapshot hour bucket " + bucket.job_id() + "/" + bucket.date() + "/" + std::to_string(bucket.hour()) + " appears twice");
    }
  }

  std::set<std::string> dates;
  for (const auto& shift : snapshot.shift_stats()) {
    if (shift.date().empty() || !dates.insert(shift.date()).second) {
      throw util::ValidationError("snapshot shift date '" + shift.date() + "' is empty or duplicated");
    }
  }
}

ExportStateResponse AdminService::ExportState(const ExportStateRequest&) {
  return ObserveRpc("AdminService.ExportState", [&] {
    std::shared_lock lock(*ctx_.line_mutex);

    const auto data = ctx_.jobs->Export();

    ExportStateResponse resp;
    auto*               snapshot = resp.mutable_snapshot();
    snapshot->set_format_version(kSnapshotFormatVersion);
    *snapshot->mutable_exported_at() = util::ToProto(ctx_.clock->Now());
    for (const auto& job : data.jobs) {
      *snapshot->add_jobs() = core::ToProto(job);
    }
    for (const auto& scan : data.scans) {
      *snapshot->add_scans() = core::ToProto(scan);
    }
    for (const auto& bucket : data.hour_buckets) {
      *snapshot->add_hour_buckets() = core::ToProto(bucket);
    }
    for (const auto& shift : data.shift_stats) {
      *snapshot->add_shift_stats() = core::ToProto(shift);
    }
    return resp;
  });
}

ImportStateResponse AdminService::ImportState(const ImportStateRequest& req) {
  return ObserveRpc("AdminService.ImportState", [&] {
    const auto& snapshot = req.snapshot();
    ValidateSnapshot(snapshot);

    core::StateData data;
    for (const auto& job : snapshot.jobs()) {
      data.jobs.push_back(core::FromProto(job));
    }
    for (const auto& scan : snapshot.scans()) {
      data.scans.push_back(core::FromProto(scan));
    }
    for (const auto& bucket : snapshot.hour_buckets()) {
      data.hour_buckets.push_back(core::FromProto(bucket));
    }
    for (const auto& shift : snapshot.shift_stats()) {
      data.shift_stats.push_back(core::FromProto(shift));
    }

    std::unique_lock lock(*ctx_.line_mutex);
    ctx_.jobs->Replace(data);

    // An import never releases a held lock; only a supervisor PIN does.
    const bool was_locked = ctx_.guard->IsLocked();
    if (was_locked && !ctx_.jobs->LineLocked()) {
      ctx_.jobs->SetLineLocked(true);
    }
    ctx_.guard->Restore(was_locked || ctx_.jobs->LineLocked());

    ImportStateResponse resp;
    resp.set_jobs(data.jobs.size());
    resp.set_scans(data.scans.size());
    resp.set_hour_buckets(data.hour_buckets.size());
    resp.set_shift_stats(data.shift_stats.size());

    LINECHECK_LOG_WARN("state imported", {IntField("jobs", static_cast<int64_t>(resp.jobs())), IntField("scans", static_cast<int64_t>(resp.scans())),
                                          IntField("hour_buckets", static_cast<int64_t>(resp.hour_buckets())),
                                          IntField("shift_stats", static_cast<int64_t>(resp.shift_stats()))});

    LineEvent event;
    auto*     restored = event.mutable_state_restored();
    restored->set_jobs(resp.jobs());
    restored->set_scans(resp.scans());
    *restored->mutable_shift() = core::ToProto(ctx_.jobs->ShiftFor(util::LocalDate(ctx_.clock->Now())));
    ctx_.hub->Publish(std::move(event));

    if (!was_locked && ctx_.guard->IsLocked()) {
      LineEvent line_event;
      *line_event.mutable_line_state() = ctx_.guard->Snapshot().ToProto();
      ctx_.hub->Publish(std::move(line_event));
    }
    return resp;
  });
}

} // namespace linecheck::service
