#include "client/cpp/line_client.h"

#include <grpcpp/client_context.h>

#include <charconv>
#include <string>
#include <system_error>
#include <thread>

namespace linecheck::client {

using namespace linecheck::v1;

namespace {

// Sleeps in short slices so a stop request is honoured promptly.
void SleepUnlessStopped(std::chrono::seconds delay, const std::atomic<bool>& stop) {
  const auto deadline = std::chrono::steady_clock::now() + delay;
  while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

// Seconds from a "retry-after" trailer, 0 when absent.
uint64_t RetryAfterSeconds(const ::grpc::ClientContext& context) {
  const auto& trailers = context.GetServerTrailingMetadata();
  const auto  it       = trailers.find("retry-after");
  if (it == trailers.end()) {
    return 0;
  }
  uint64_t   seconds = 0;
  const auto end     = it->second.data() + it->second.length();
  if (std::from_chars(it->second.data(), end, seconds).ec != std::errc()) {
    return 0;
  }
  return seconds;
}

} // namespace

LineClient::LineClient(std::shared_ptr<::grpc::Channel> channel, std::string admin_token)
    : line_stub_(LineService::NewStub(channel)), admin_stub_(AdminService::NewStub(channel)), admin_token_(std::move(admin_token)) {
}

void LineClient::Authorize(::grpc::ClientContext* context) const {
  if (!admin_token_.empty()) {
    context->AddMetadata("authorization", "Bearer " + admin_token_);
  }
}

::grpc::Status LineClient::StartJob(const StartJobRequest& req, StartJobResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->StartJob(&context, req, resp);
}

::grpc::Status LineClient::ProcessScan(const ProcessScanRequest& req, ProcessScanResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->ProcessScan(&context, req, resp);
}

::grpc::Status LineClient::EndJob(const EndJobRequest& req, EndJobResponse* resp, uint64_t* retry_after_seconds) const {
  ::grpc::ClientContext context;
  auto                  status = line_stub_->EndJob(&context, req, resp);
  if (retry_after_seconds) {
    *retry_after_seconds = RetryAfterSeconds(context);
  }
  return status;
}

::grpc::Status LineClient::VerifyPin(const VerifyPinRequest& req, VerifyPinResponse* resp, uint64_t* retry_after_seconds) const {
  ::grpc::ClientContext context;
  auto                  status = line_stub_->VerifyPin(&context, req, resp);
  if (retry_after_seconds) {
    *retry_after_seconds = RetryAfterSeconds(context);
  }
  return status;
}

::grpc::Status LineClient::GetStatus(GetStatusResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->GetStatus(&context, GetStatusRequest(), resp);
}

::grpc::Status LineClient::GetHourlyStats(const GetHourlyStatsRequest& req, GetHourlyStatsResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->GetHourlyStats(&context, req, resp);
}

::grpc::Status LineClient::GetJob(const GetJobRequest& req, GetJobResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->GetJob(&context, req, resp);
}

::grpc::Status LineClient::ListJobs(const ListJobsRequest& req, ListJobsResponse* resp) const {
  ::grpc::ClientContext context;
  return line_stub_->ListJobs(&context, req, resp);
}

::grpc::Status LineClient::ExportState(ExportStateResponse* resp) const {
  ::grpc::ClientContext context;
  Authorize(&context);
  return admin_stub_->ExportState(&context, ExportStateRequest(), resp);
}

::grpc::Status LineClient::ImportState(const ImportStateRequest& req, ImportStateResponse* resp) const {
  ::grpc::ClientContext context;
  Authorize(&context);
  return admin_stub_->ImportState(&context, req, resp);
}

std::unique_ptr<::grpc::ClientReader<LineEvent>> LineClient::Subscribe(::grpc::ClientContext* context) const {
  return line_stub_->Subscribe(context, SubscribeRequest());
}

void LineClient::Watch(const WatchHandlers& handlers, const std::atomic<bool>& stop, ReconnectBackoff backoff) const {
  while (!stop.load()) {
    ::grpc::ClientContext context;
    auto                  reader = Subscribe(&context);

    // a blocked Read() only returns once the call is cancelled
    std::atomic<bool> session_over{false};
    std::thread       canceller([&] {
      while (!session_over.load()) {
        if (stop.load()) {
          context.TryCancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });

    LineEvent event;
    bool      synced = false;
    while (!stop.load() && reader->Read(&event)) {
      if (!synced && event.has_snapshot()) {
        synced = true;
        backoff.Reset();
        if (handlers.on_status) {
          handlers.on_status(event.snapshot());
        }
        continue;
      }
      if (synced && handlers.on_event) {
        handlers.on_event(event);
      }
    }
    session_over = true;
    canceller.join();
    if (stop.load()) {
      context.TryCancel();
    }

    const auto status = reader->Finish();
    if (stop.load()) {
      return;
    }

    const auto delay = backoff.Next();
    if (handlers.on_disconnect) {
      handlers.on_disconnect(status, delay);
    }
    SleepUnlessStopped(delay, stop);
  }
}

} // namespace linecheck::client
