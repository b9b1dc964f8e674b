#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>

#include "internal/service/line_service.hpp"
#include "linecheck/v1/line_service.grpc.pb.h"

namespace linecheck::grpc {

class LineServer final : public linecheck::v1::LineService::Service {
 public:
  explicit LineServer(std::shared_ptr<linecheck::service::LineService> svc, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250));

  ::grpc::Status StartJob(::grpc::ServerContext*, const linecheck::v1::StartJobRequest*, linecheck::v1::StartJobResponse*) override;

  ::grpc::Status ProcessScan(::grpc::ServerContext*, const linecheck::v1::ProcessScanRequest*, linecheck::v1::ProcessScanResponse*) override;

  ::grpc::Status EndJob(::grpc::ServerContext*, const linecheck::v1::EndJobRequest*, linecheck::v1::EndJobResponse*) override;

  ::grpc::Status VerifyPin(::grpc::ServerContext*, const linecheck::v1::VerifyPinRequest*, linecheck::v1::VerifyPinResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*, const linecheck::v1::GetStatusRequest*, linecheck::v1::GetStatusResponse*) override;

  ::grpc::Status GetHourlyStats(::grpc::ServerContext*, const linecheck::v1::GetHourlyStatsRequest*,
                                linecheck::v1::GetHourlyStatsResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*, const linecheck::v1::GetJobRequest*, linecheck::v1::GetJobResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*, const linecheck::v1::ListJobsRequest*, linecheck::v1::ListJobsResponse*) override;

  // Writes a status snapshot, then streams LineEvents until the client
  // cancels or the hub shuts down.
  ::grpc::Status Subscribe(::grpc::ServerContext*, const linecheck::v1::SubscribeRequest*, ::grpc::ServerWriter<linecheck::v1::LineEvent>*) override;

 private:
  std::shared_ptr<linecheck::service::LineService> service_;
  std::chrono::milliseconds                        poll_interval_;
};

} // namespace linecheck::grpc
