#include "line_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace linecheck::grpc {

using namespace linecheck::v1;

LineServer::LineServer(std::shared_ptr<linecheck::service::LineService> svc, std::chrono::milliseconds poll_interval)
    : service_(std::move(svc)), poll_interval_(poll_interval) {
}

::grpc::Status LineServer::StartJob(::grpc::ServerContext* ctx, const StartJobRequest* req, StartJobResponse* resp) {
  try {
    *resp = service_->StartJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::ProcessScan(::grpc::ServerContext* ctx, const ProcessScanRequest* req, ProcessScanResponse* resp) {
  try {
    *resp = service_->ProcessScan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::EndJob(::grpc::ServerContext* ctx, const EndJobRequest* req, EndJobResponse* resp) {
  try {
    *resp = service_->EndJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::VerifyPin(::grpc::ServerContext* ctx, const VerifyPinRequest* req, VerifyPinResponse* resp) {
  try {
    *resp = service_->VerifyPin(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::GetStatus(::grpc::ServerContext* ctx, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::GetHourlyStats(::grpc::ServerContext* ctx, const GetHourlyStatsRequest* req, GetHourlyStatsResponse* resp) {
  try {
    *resp = service_->GetHourlyStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::GetJob(::grpc::ServerContext* ctx, const GetJobRequest* req, GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::ListJobs(::grpc::ServerContext* ctx, const ListJobsRequest* req, ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status LineServer::Subscribe(::grpc::ServerContext* ctx, const SubscribeRequest*, ::grpc::ServerWriter<LineEvent>* writer) {
  linecheck::service::LineService::EventStream stream;
  try {
    stream = service_->OpenEventStream();
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }

  auto& subscription = stream.subscription;
  if (subscription->Closed()) {
    return ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "server is shutting down");
  }
  if (!writer->Write(stream.snapshot)) {
    return ::grpc::Status::OK;
  }

  while (!ctx->IsCancelled()) {
    auto event = subscription->Next(poll_interval_);
    if (!event) {
      if (subscription->Closed()) {
        break;
      }
      continue;
    }
    if (!writer->Write(*event)) {
      LINECHECK_LOG_INFO("subscriber stream closed by peer",
                         {observability::IntField("subscriber_id", static_cast<int64_t>(subscription->Id()))});
      break;
    }
  }
  return ::grpc::Status::OK;
}

} // namespace linecheck::grpc
