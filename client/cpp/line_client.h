#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>
#include <grpcpp/support/sync_stream.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "client/cpp/reconnect_backoff.h"
#include "linecheck/v1/admin_service.grpc.pb.h"
#include "linecheck/v1/line_service.grpc.pb.h"

namespace linecheck::client {

/*
  Typed client for LineService and AdminService.

  Unary calls return the gRPC status and fill `resp` on success. The
  admin token, when set, is sent as "authorization: Bearer <token>".
*/
class LineClient {
 public:
  struct WatchHandlers {
    // Called with the snapshot that opens every (re)connected stream, before
    // any event of that session.
    std::function<void(const linecheck::v1::GetStatusResponse&)> on_status;
    std::function<void(const linecheck::v1::LineEvent&)>         on_event;
    // Called when a session ends; `retry_in` is the wait before reconnecting.
    std::function<void(const ::grpc::Status&, std::chrono::seconds retry_in)> on_disconnect;
  };

  explicit LineClient(std::shared_ptr<::grpc::Channel> channel, std::string admin_token = {});

  ::grpc::Status StartJob(const linecheck::v1::StartJobRequest& req, linecheck::v1::StartJobResponse* resp) const;
  ::grpc::Status ProcessScan(const linecheck::v1::ProcessScanRequest& req, linecheck::v1::ProcessScanResponse* resp) const;
  // PIN calls report the server's "retry-after" trailer (0 when absent) during a lockout.
  ::grpc::Status EndJob(const linecheck::v1::EndJobRequest& req, linecheck::v1::EndJobResponse* resp, uint64_t* retry_after_seconds = nullptr) const;
  ::grpc::Status VerifyPin(const linecheck::v1::VerifyPinRequest& req, linecheck::v1::VerifyPinResponse* resp,
                           uint64_t* retry_after_seconds = nullptr) const;
  ::grpc::Status GetStatus(linecheck::v1::GetStatusResponse* resp) const;
  ::grpc::Status GetHourlyStats(const linecheck::v1::GetHourlyStatsRequest& req, linecheck::v1::GetHourlyStatsResponse* resp) const;
  ::grpc::Status GetJob(const linecheck::v1::GetJobRequest& req, linecheck::v1::GetJobResponse* resp) const;
  ::grpc::Status ListJobs(const linecheck::v1::ListJobsRequest& req, linecheck::v1::ListJobsResponse* resp) const;

  ::grpc::Status ExportState(linecheck::v1::ExportStateResponse* resp) const;
  ::grpc::Status ImportState(const linecheck::v1::ImportStateRequest& req, linecheck::v1::ImportStateResponse* resp) const;

  std::unique_ptr<::grpc::ClientReader<linecheck::v1::LineEvent>> Subscribe(::grpc::ClientContext* context) const;

  /*
    Follows the event stream until `stop` is set, reconnecting with
    `backoff`. Events published while disconnected are not replayed; the
    snapshot opening each stream covers them. Setting `stop` cancels a
    blocked read.
  */
  void Watch(const WatchHandlers& handlers, const std::atomic<bool>& stop, ReconnectBackoff backoff = ReconnectBackoff()) const;

 private:
  void Authorize(::grpc::ClientContext* context) const;

  std::unique_ptr<linecheck::v1::LineService::Stub>  line_stub_;
  std::unique_ptr<linecheck::v1::AdminService::Stub> admin_stub_;
  std::string                                        admin_token_;
};

} // namespace linecheck::client
