#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/line_client.h"

namespace {

void PrintJob(const linecheck::v1::JobView& view) {
  const auto& job = view.job();
  std::cout << "  job " << job.job_id() << ": " << job.pass_count() << " pass / " << job.fail_count() << " fail, " << job.total_pieces()
            << " pieces, pass rate " << view.pass_rate() << "%, elapsed " << view.elapsed() << '\n';
}

} // namespace

int main(int argc, char** argv) {
  // A scan station: every stdin line is one barcode read. Run with
  // <target> <job_id> <expected_barcode> to start a job first.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  linecheck::client::LineClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  if (argc > 3) {
    linecheck::v1::StartJobRequest req;
    req.set_job_id(argv[2]);
    req.set_expected_barcode(argv[3]);
    linecheck::v1::StartJobResponse resp;
    auto                            status = client.StartJob(req, &resp);
    if (!status.ok()) {
      std::cerr << "StartJob failed: " << status.error_message() << '\n';
      return 1;
    }
    std::cout << "started job " << resp.job().job().job_id() << ", expecting " << resp.job().job().expected_barcode() << '\n';
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }

    linecheck::v1::ProcessScanRequest req;
    req.set_barcode(line);
    linecheck::v1::ProcessScanResponse resp;
    auto                               status = client.ProcessScan(req, &resp);

    if (status.error_code() == grpc::StatusCode::ABORTED) {
      // line is locked; the next stdin line is taken as the supervisor PIN
      std::cout << "LINE LOCKED - enter supervisor PIN: " << std::flush;
      std::string pin;
      if (!std::getline(std::cin, pin)) {
        break;
      }
      linecheck::v1::VerifyPinRequest pin_req;
      pin_req.set_pin(pin);
      linecheck::v1::VerifyPinResponse pin_resp;
      uint64_t                         retry_after = 0;
      auto                             pin_status  = client.VerifyPin(pin_req, &pin_resp, &retry_after);
      if (!pin_status.ok()) {
        std::cout << "PIN rejected: " << pin_status.error_message();
        if (retry_after > 0) {
          std::cout << " (retry in " << retry_after << "s)";
        }
        std::cout << '\n';
      } else {
        std::cout << "line unlocked\n";
      }
      continue;
    }
    if (!status.ok()) {
      std::cerr << "ProcessScan failed: " << status.error_message() << '\n';
      continue;
    }

    const bool pass = resp.scan().status() == linecheck::v1::SCAN_STATUS_PASS;
    std::cout << (pass ? "PASS " : "FAIL ") << resp.scan().barcode() << '\n';
    PrintJob(resp.job());
    if (resp.line().state() != linecheck::v1::LOCK_STATE_UNLOCKED) {
      std::cout << "  line halted: scan the correct label after a supervisor unlock\n";
    }
  }
  return 0;
}
