#pragma once

#include <memory>

#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/util/time.hpp"
#include "linecheck/v1/line_service.pb.h"
#include "service_context.hpp"

namespace linecheck::service {

/*
  Operator-facing line operations.

  Writers (StartJob, ProcessScan, EndJob, VerifyPin) run under the
  exclusive side of ctx.line_mutex and publish their event before
  releasing it, so every subscriber sees events in production order.
  A persisted line lock is restored into ctx.guard on construction.
*/
class LineService {
 public:
  explicit LineService(ServiceContext ctx);

  linecheck::v1::StartJobResponse    StartJob(const linecheck::v1::StartJobRequest& req);
  linecheck::v1::ProcessScanResponse ProcessScan(const linecheck::v1::ProcessScanRequest& req);
  linecheck::v1::EndJobResponse      EndJob(const linecheck::v1::EndJobRequest& req);
  linecheck::v1::VerifyPinResponse   VerifyPin(const linecheck::v1::VerifyPinRequest& req);

  linecheck::v1::GetStatusResponse      GetStatus(const linecheck::v1::GetStatusRequest& req);
  linecheck::v1::GetHourlyStatsResponse GetHourlyStats(const linecheck::v1::GetHourlyStatsRequest& req);
  linecheck::v1::GetJobResponse         GetJob(const linecheck::v1::GetJobRequest& req);
  linecheck::v1::ListJobsResponse       ListJobs(const linecheck::v1::ListJobsRequest& req);

  std::unique_ptr<broadcast::BroadcastHub::Subscription> Subscribe();

  struct EventStream {
    std::unique_ptr<broadcast::BroadcastHub::Subscription> subscription;
    linecheck::v1::LineEvent                               snapshot; // kind() == kSnapshot
  };

  // Registers a subscriber and captures the status it starts from, with no
  // writer in between: the subscription holds exactly the events after it.
  EventStream OpenEventStream();

 private:
  linecheck::v1::GetStatusResponse BuildStatus(util::TimePoint now);
  linecheck::v1::JobView BuildJobView(const db::model::JobRecord& job, util::TimePoint now, bool with_hours);
  void                   PublishLineState();

  ServiceContext ctx_;
};

} // namespace linecheck::service
