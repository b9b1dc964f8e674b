#include "internal/core/verification_engine.hpp"

#include <stdexcept>

#include "internal/core/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace linecheck::core {

using linecheck::observability::StringField;

VerificationEngine::VerificationEngine(std::shared_ptr<JobStore> jobs, std::shared_ptr<lock::LineLockGuard> guard,
                                       std::shared_ptr<hardware::SignalDevice> device)
    : jobs_(std::move(jobs)), guard_(std::move(guard)), device_(std::move(device)) {
  if (!jobs_ || !guard_ || !device_) {
    throw std::invalid_argument("VerificationEngine requires a job store, a lock guard and a signal device");
  }
}

ScanOutcome VerificationEngine::Process(std::string_view raw_barcode) {
  observability::SpanScope span("VerificationEngine.Process");

  const auto job = jobs_->ActiveJob();
  if (!job) {
    throw util::NoActiveJobError("no active job; start a job before scanning");
  }
  if (guard_->IsLocked()) {
    throw util::LineLockedError("line is locked after a failed scan; supervisor PIN required");
  }
  const auto barcode = NormalizeScanInput(raw_barcode);

  const bool pass   = barcode == job->expected_barcode;
  const auto status = pass ? linecheck::v1::SCAN_STATUS_PASS : linecheck::v1::SCAN_STATUS_FAIL;

  ScanOutcome outcome;
  outcome.scan = jobs_->RecordScan(barcode, status);
  observability::LineMetrics::Instance().RecordScan(pass);
  span.SetAttribute(observability::kAttrJobId, job->job_id);
  span.SetAttribute(observability::kAttrScanStatus, pass ? "pass" : "fail");

  if (pass) {
    hardware::InvokeSignal(*device_, hardware::Signal::kPass);
  } else {
    LINECHECK_LOG_WARN("scan mismatch", {StringField("job_id", job->job_id), StringField("barcode", barcode), StringField("expected", job->expected_barcode)});
    hardware::InvokeSignal(*device_, hardware::Signal::kFail);
    guard_->Engage();
  }

  outcome.job         = jobs_->ActiveJob().value_or(*job);
  outcome.recent      = jobs_->RecentScans();
  outcome.line_locked = guard_->IsLocked();
  return outcome;
}

} // namespace linecheck::core
