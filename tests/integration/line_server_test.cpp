#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/line_client.h"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/line_server.hpp"
#include "internal/runtime/server.hpp"
#include "tests/support/line_fixture.hpp"

namespace {

using linecheck::client::LineClient;
using linecheck::client::ReconnectBackoff;
using linecheck::testing::kSupervisorPin;
using linecheck::testing::LineFixture;
using namespace linecheck::v1;

constexpr const char* kAdminToken = "integration-token";

// Line fixture served on an ephemeral localhost port.
struct ServedLine {
  ServedLine() {
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<linecheck::grpc::LineServer>(line.line, std::chrono::milliseconds(20)));
    services.push_back(std::make_unique<linecheck::grpc::AdminServer>(line.admin, kAdminToken));
    server = std::make_unique<linecheck::runtime::Server>("127.0.0.1:0", std::move(services));
    server->Start();
    target = "127.0.0.1:" + std::to_string(server->SelectedPort());
  }

  ~ServedLine() {
    server->Stop(std::chrono::milliseconds(200));
    line.hub->Shutdown();
  }

  LineClient Client(const std::string& token = {}) const {
    return LineClient(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()), token);
  }

  bool WaitForSubscribers(std::size_t n) const {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (line.hub->SubscriberCount() >= n) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  LineFixture                                 line;
  std::unique_ptr<linecheck::runtime::Server> server;
  std::string                                 target;
};

void TestOperatorFlowOverTheWire() {
  ServedLine served;
  auto       client = served.Client();

  ProcessScanRequest scan;
  scan.set_barcode("ABC123");
  ProcessScanResponse scanned;
  assert(client.ProcessScan(scan, &scanned).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  StartJobRequest start;
  start.set_job_id("WIRE-1");
  start.set_expected_barcode("ABC123");
  start.set_pieces_per_shipper(2);
  StartJobResponse started;
  assert(client.StartJob(start, &started).ok());
  assert(started.job().job().job_id() == "WIRE-1");
  assert(client.StartJob(start, &started).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  assert(client.ProcessScan(scan, &scanned).ok());
  assert(scanned.scan().status() == SCAN_STATUS_PASS);
  assert(scanned.job().job().total_pieces() == 2);

  scan.set_barcode("XYZ");
  assert(client.ProcessScan(scan, &scanned).ok());
  assert(scanned.scan().status() == SCAN_STATUS_FAIL);
  assert(scanned.line().state() == LOCK_STATE_LOCKED);

  scan.set_barcode("ABC123");
  assert(client.ProcessScan(scan, &scanned).error_code() == ::grpc::StatusCode::ABORTED);

  VerifyPinRequest pin;
  pin.set_pin(kSupervisorPin);
  VerifyPinResponse verified;
  assert(client.VerifyPin(pin, &verified).ok());
  assert(verified.line().state() == LOCK_STATE_UNLOCKED);

  GetStatusResponse status;
  assert(client.GetStatus(&status).ok());
  assert(status.active_job().job().total_scans() == 2);
  assert(status.line_name() == "Line 1");

  EndJobRequest end;
  end.set_pin(kSupervisorPin);
  EndJobResponse ended;
  assert(client.EndJob(end, &ended).ok());
  assert(ended.summary().pass_count() == 1);
  assert(ended.shift().total_shippers() == 1);

  GetJobRequest get;
  get.set_job_id("WIRE-1");
  GetJobResponse job;
  assert(client.GetJob(get, &job).ok());
  assert(job.scans_size() == 2);

  ListJobsResponse jobs;
  assert(client.ListJobs(ListJobsRequest{}, &jobs).ok());
  assert(jobs.total() == 1);

  GetHourlyStatsResponse hourly;
  assert(client.GetHourlyStats(GetHourlyStatsRequest{}, &hourly).ok());
  assert(hourly.hours_size() == 13);
}

void TestLockoutCarriesRetryAfter() {
  ServedLine served;
  auto       client = served.Client();

  VerifyPinRequest wrong;
  wrong.set_pin("0000");
  VerifyPinResponse resp;
  for (int i = 0; i < 5; ++i) {
    assert(client.VerifyPin(wrong, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }

  VerifyPinRequest right;
  right.set_pin(kSupervisorPin);
  uint64_t retry_after = 0;
  auto     status      = client.VerifyPin(right, &resp, &retry_after);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(retry_after == 15 * 60);

  served.line.clock->Advance(std::chrono::minutes(15));
  retry_after = 1;
  assert(client.VerifyPin(right, &resp, &retry_after).ok());
  assert(retry_after == 0);
}

void TestSubscribersReceiveEventsInOrder() {
  ServedLine served;
  auto       client = served.Client();

  std::mutex             mutex;
  std::condition_variable cv;
  std::vector<LineEvent>  events;
  std::vector<GetStatusResponse> snapshots;
  std::atomic<bool>       stop{false};

  // state from before the stream opened arrives in the snapshot
  served.line.Start("STREAM-0", "OLD");
  served.line.Scan("OLD");
  served.line.End();

  LineClient::WatchHandlers handlers;
  handlers.on_status = [&](const GetStatusResponse& status) {
    std::lock_guard<std::mutex> lock(mutex);
    snapshots.push_back(status);
  };
  handlers.on_event = [&](const LineEvent& event) {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(event);
    cv.notify_all();
  };

  std::thread watcher([&] { client.Watch(handlers, stop, ReconnectBackoff(std::chrono::seconds(1), std::chrono::seconds(1))); });
  assert(served.WaitForSubscribers(1));

  served.line.Start("STREAM-1", "ABC123");
  served.line.Scan("ABC123");
  served.line.Scan("NOPE");

  {
    std::unique_lock<std::mutex> lock(mutex);
    assert(cv.wait_for(lock, std::chrono::seconds(5), [&] { return events.size() >= 4; }));
    assert(snapshots.size() == 1);
    assert(!snapshots[0].has_active_job());
    assert(snapshots[0].shift().jobs_completed() == 1);
    assert(snapshots[0].line().state() == LOCK_STATE_UNLOCKED);
    assert(events[0].has_job_started());
    assert(events[1].has_scan() && events[1].scan().scan().status() == SCAN_STATUS_PASS);
    assert(events[2].has_scan() && events[2].scan().scan().status() == SCAN_STATUS_FAIL);
    assert(events[3].has_line_state() && events[3].line_state().state() == LOCK_STATE_LOCKED);
    for (std::size_t i = 1; i < events.size(); ++i) {
      assert(events[i].sequence() == events[i - 1].sequence() + 1);
    }
  }

  // stop cancels the blocked read; no further traffic is needed
  stop = true;
  watcher.join();
}

void TestImportRequiresBearerToken() {
  ServedLine source;
  source.line.Start("SNAP-1", "ABC123", 3);
  source.line.Scan("ABC123");

  ExportStateResponse exported;
  assert(source.Client().ExportState(&exported).ok());
  assert(exported.snapshot().jobs_size() == 1);

  ServedLine         target;
  ImportStateRequest req;
  *req.mutable_snapshot() = exported.snapshot();
  ImportStateResponse resp;

  assert(target.Client().ImportState(req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(target.Client("wrong-token").ImportState(req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(target.Client(kAdminToken).ImportState(req, &resp).ok());
  assert(resp.jobs() == 1 && resp.scans() == 1);

  GetStatusResponse status;
  assert(target.Client().GetStatus(&status).ok());
  assert(status.active_job().job().job_id() == "SNAP-1");
  assert(status.active_job().job().total_pieces() == 3);

  auto bad = req;
  bad.mutable_snapshot()->mutable_scans(0)->set_job_id("GHOST");
  assert(target.Client(kAdminToken).ImportState(bad, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestOperatorFlowOverTheWire();
  TestLockoutCarriesRetryAfter();
  TestSubscribersReceiveEventsInOrder();
  TestImportRequiresBearerToken();

  std::cout << "linecheck_integration_line_server: pass\n";
  return 0;
}
