#include "line_service.hpp"

#include <mutex>
#include <shared_mutex>
#include <stdexcept>

#include "internal/core/aggregation.hpp"
#include "internal/core/job_store.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/core/verification_engine.hpp"
#include "internal/hardware/signal_device.hpp"
#include "internal/lock/line_lock_guard.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace linecheck::service {

using namespace linecheck::v1;

namespace {

JobSummary BuildSummary(const db::model::JobRecord& job, util::TimePoint now) {
  const auto elapsed = core::Elapsed(job, now);

  JobSummary summary;
  summary.set_job_id(job.job_id);
  summary.set_total_scans(job.total_scans);
  summary.set_total_pieces(job.total_pieces);
  summary.set_pass_count(job.pass_count);
  summary.set_fail_count(job.fail_count);
  summary.set_pass_rate(core::RoundPassRate(core::PassRate(job)));
  summary.set_elapsed(core::FormatElapsed(elapsed));
  summary.set_elapsed_seconds(static_cast<uint64_t>(elapsed.count()));
  return summary;
}

HourCount ToHourCount(const core::HourTotals& totals) {
  HourCount count;
  count.set_shippers(totals.shippers);
  count.set_pieces(totals.pieces);
  return count;
}

} // namespace

LineService::LineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.jobs || !ctx_.engine || !ctx_.guard || !ctx_.hub || !ctx_.device || !ctx_.clock || !ctx_.line_mutex) {
    throw std::invalid_argument("LineService requires a fully populated ServiceContext");
  }
  if (ctx_.jobs->LineLocked()) {
    ctx_.guard->Restore(true);
  }
}

JobView LineService::BuildJobView(const db::model::JobRecord& job, util::TimePoint now, bool with_hours) {
  const auto elapsed = core::Elapsed(job, now);

  JobView view;
  *view.mutable_job() = core::ToProto(job);
  view.set_pass_rate(core::RoundPassRate(core::PassRate(job)));
  view.set_elapsed_seconds(static_cast<uint64_t>(elapsed.count()));
  view.set_elapsed(core::FormatElapsed(elapsed));
  view.set_progress_percent(core::Progress(job));
  if (with_hours) {
    *view.mutable_this_hour()     = ToHourCount(ctx_.jobs->JobHourTotals(job.job_id, now));
    *view.mutable_previous_hour() = ToHourCount(ctx_.jobs->JobHourTotals(job.job_id, now, -1));
  }
  return view;
}

void LineService::PublishLineState() {
  LineEvent event;
  *event.mutable_line_state() = ctx_.guard->Snapshot().ToProto();
  ctx_.hub->Publish(std::move(event));
}

StartJobResponse LineService::StartJob(const StartJobRequest& req) {
  return ObserveRpc("LineService.StartJob", [&] {
    std::unique_lock lock(*ctx_.line_mutex);

    core::JobSpec spec;
    spec.job_id           = req.job_id();
    spec.expected_barcode = req.expected_barcode();
    if (req.has_pieces_per_shipper()) {
      spec.pieces_per_shipper = req.pieces_per_shipper();
    }
    spec.target_quantity = req.target_quantity();
    spec.line_locked     = ctx_.guard->IsLocked();

    const auto job = ctx_.jobs->StartJob(spec);

    StartJobResponse resp;
    *resp.mutable_job() = BuildJobView(job, ctx_.clock->Now(), true);

    LineEvent event;
    *event.mutable_job_started() = resp.job();
    ctx_.hub->Publish(std::move(event));
    return resp;
  });
}

ProcessScanResponse LineService::ProcessScan(const ProcessScanRequest& req) {
  return ObserveRpc("LineService.ProcessScan", [&] {
    std::unique_lock lock(*ctx_.line_mutex);

    const bool was_locked = ctx_.guard->IsLocked();
    const auto outcome    = ctx_.engine->Process(req.barcode());

    ProcessScanResponse resp;
    *resp.mutable_scan() = core::ToProto(outcome.scan);
    *resp.mutable_job()  = BuildJobView(outcome.job, ctx_.clock->Now(), true);
    for (const auto& scan : outcome.recent) {
      *resp.add_recent_scans() = core::ToProto(scan);
    }
    *resp.mutable_line() = ctx_.guard->Snapshot().ToProto();

    LineEvent event;
    auto*     scan_event                = event.mutable_scan();
    *scan_event->mutable_scan()         = resp.scan();
    *scan_event->mutable_job()          = resp.job();
    *scan_event->mutable_recent_scans() = resp.recent_scans();
    *scan_event->mutable_line()         = resp.line();
    ctx_.hub->Publish(std::move(event));

    if (!was_locked && outcome.line_locked) {
      PublishLineState();
    }
    return resp;
  });
}

EndJobResponse LineService::EndJob(const EndJobRequest& req) {
  return ObserveRpc("LineService.EndJob", [&] {
    std::unique_lock lock(*ctx_.line_mutex);

    if (!ctx_.jobs->ActiveJob()) {
      throw util::NotFoundError("no active job to end");
    }
    ctx_.guard->AuthorizeEndJob(req.pin());

    const auto ended = ctx_.jobs->EndJob();
    const auto now   = ctx_.clock->Now();

    EndJobResponse resp;
    *resp.mutable_summary() = BuildSummary(ended.job, now);
    *resp.mutable_shift()   = core::ToProto(ended.shift);

    LineEvent ended_event;
    auto*     body           = ended_event.mutable_job_ended();
    *body->mutable_summary() = resp.summary();
    *body->mutable_job()     = BuildJobView(ended.job, now, false);
    *body->mutable_shift()   = resp.shift();
    ctx_.hub->Publish(std::move(ended_event));

    LineEvent shift_event;
    *shift_event.mutable_shift_update() = resp.shift();
    ctx_.hub->Publish(std::move(shift_event));
    return resp;
  });
}

VerifyPinResponse LineService::VerifyPin(const VerifyPinRequest& req) {
  return ObserveRpc("LineService.VerifyPin", [&] {
    std::unique_lock lock(*ctx_.line_mutex);

    const bool unlocked = ctx_.guard->Resume(req.pin(), [&] { ctx_.jobs->SetLineLocked(false); });

    VerifyPinResponse resp;
    *resp.mutable_line() = ctx_.guard->Snapshot().ToProto();
    if (unlocked) {
      PublishLineState();
    }
    return resp;
  });
}

GetStatusResponse LineService::BuildStatus(util::TimePoint now) {
  GetStatusResponse resp;
  if (const auto job = ctx_.jobs->ActiveJob()) {
    *resp.mutable_active_job() = BuildJobView(*job, now, true);
  }
  *resp.mutable_shift()       = core::ToProto(ctx_.jobs->ShiftFor(util::LocalDate(now)));
  *resp.mutable_line()        = ctx_.guard->Snapshot().ToProto();
  resp.set_line_name(ctx_.settings.line_name);
  *resp.mutable_server_time() = util::ToProto(now);
  resp.set_hardware_enabled(ctx_.device->Enabled());
  return resp;
}

GetStatusResponse LineService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("LineService.GetStatus", [&] {
    std::shared_lock lock(*ctx_.line_mutex);
    return BuildStatus(ctx_.clock->Now());
  });
}

GetHourlyStatsResponse LineService::GetHourlyStats(const GetHourlyStatsRequest& req) {
  return ObserveRpc("LineService.GetHourlyStats", [&] {
    std::shared_lock lock(*ctx_.line_mutex);

    const auto date = req.date().empty() ? util::LocalDate(ctx_.clock->Now()) : req.date();
    const auto rows = core::BuildHourlyReport(ctx_.jobs->HourBuckets(date), ctx_.settings.report_first_hour, ctx_.settings.report_last_hour);

    GetHourlyStatsResponse resp;
    resp.set_date(date);
    for (const auto& row : rows) {
      auto* stat = resp.add_hours();
      stat->set_hour(row.hour);
      stat->set_shippers(row.shippers);
      stat->set_pieces(row.pieces);
      stat->set_cumulative_pieces(row.cumulative_pieces);
    }
    return resp;
  });
}

GetJobResponse LineService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("LineService.GetJob", [&] {
    std::shared_lock lock(*ctx_.line_mutex);

    const auto job = ctx_.jobs->FindJob(req.job_id());
    if (!job) {
      throw util::NotFoundError("job '" + req.job_id() + "' not found");
    }

    GetJobResponse resp;
    *resp.mutable_job() = BuildJobView(*job, ctx_.clock->Now(), job->is_active);
    for (const auto& scan : ctx_.jobs->JobScans(job->job_id, req.scan_limit())) {
      *resp.add_scans() = core::ToProto(scan);
    }
    return resp;
  });
}

ListJobsResponse LineService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("LineService.ListJobs", [&] {
    std::shared_lock lock(*ctx_.line_mutex);

    const auto now  = ctx_.clock->Now();
    const auto page = ctx_.jobs->ListJobs(req.page(), req.page_size());

    ListJobsResponse resp;
    for (const auto& job : page.jobs) {
      *resp.add_jobs() = BuildJobView(job, now, false);
    }
    resp.set_total(page.total);
    resp.set_page(static_cast<uint32_t>(page.page));
    resp.set_pages(static_cast<uint32_t>((page.total + page.page_size - 1) / page.page_size));
    return resp;
  });
}

std::unique_ptr<broadcast::BroadcastHub::Subscription> LineService::Subscribe() {
  return ctx_.hub->Subscribe();
}

LineService::EventStream LineService::OpenEventStream() {
  return ObserveRpc("LineService.Subscribe", [&] {
    // writers publish under the exclusive side, so none can slip in here
    std::shared_lock lock(*ctx_.line_mutex);

    EventStream stream;
    stream.subscription = ctx_.hub->Subscribe();

    const auto now = ctx_.clock->Now();
    stream.snapshot.set_sequence(ctx_.hub->LastSequence());
    *stream.snapshot.mutable_published_at() = util::ToProto(now);
    *stream.snapshot.mutable_snapshot()     = BuildStatus(now);
    return stream;
  });
}

} // namespace linecheck::service
