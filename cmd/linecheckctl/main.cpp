#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "client/cpp/line_client.h"
#include "linecheck/v1.hpp"

using namespace linecheck::v1;
using linecheck::client::LineClient;

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int) {
  g_stop.store(true);
}

void Usage() {
  std::cout << "Usage:\n"
            << "  linecheckctl <addr> status\n"
            << "  linecheckctl <addr> start <expected_barcode> [pieces_per_shipper] [target_quantity] [job_id]\n"
            << "  linecheckctl <addr> scan <barcode>\n"
            << "  linecheckctl <addr> end <pin>\n"
            << "  linecheckctl <addr> verify-pin <pin>\n"
            << "  linecheckctl <addr> hourly [YYYY-MM-DD]\n"
            << "  linecheckctl <addr> job <job_id> [scan_limit]\n"
            << "  linecheckctl <addr> jobs [page] [page_size]\n"
            << "  linecheckctl <addr> watch\n"
            << "  linecheckctl <addr> export [file.json]\n"
            << "  linecheckctl <addr> import <file.json>\n"
            << "\n"
            << "export/import send LINECHECK_ADMIN_TOKEN as a bearer token.\n";
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

int Print(const ::grpc::Status& status, const google::protobuf::Message& resp, uint64_t retry_after = 0) {
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    if (retry_after > 0) {
      std::cerr << "retry after " << retry_after << "s\n";
    }
    return 2;
  }
  std::cout << ToJson(resp);
  return 0;
}

int64_t ParseInt(const char* value, const char* name) {
  char*      end    = nullptr;
  const auto parsed = std::strtoll(value, &end, 10);
  if (end == value || *end != '\0') {
    std::cerr << "invalid " << name << ": " << value << "\n";
    std::exit(1);
  }
  return parsed;
}

int Watch(const LineClient& client) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  uint64_t                 last_sequence = 0;
  LineClient::WatchHandlers handlers;
  handlers.on_status = [](const GetStatusResponse& status) { std::cout << "# status\n" << ToJson(status); };
  handlers.on_event  = [&last_sequence](const LineEvent& event) {
    if (last_sequence != 0 && event.sequence() != last_sequence + 1) {
      std::cout << "# gap: missed " << (event.sequence() - last_sequence - 1) << " event(s)\n";
    }
    last_sequence = event.sequence();
    std::cout << ToJson(event);
  };
  handlers.on_disconnect = [&last_sequence](const ::grpc::Status& status, std::chrono::seconds retry_in) {
    last_sequence = 0;
    std::cerr << "# disconnected (" << status.error_message() << "), retrying in " << retry_in.count() << "s\n";
  };

  client.Watch(handlers, g_stop);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  const char* token = std::getenv("LINECHECK_ADMIN_TOKEN");
  LineClient  client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()), token ? token : "");

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusResponse resp;
    return Print(client.GetStatus(&resp), resp);
  }

  if (cmd == "start") {
    if (argc < 4) return 1;

    StartJobRequest req;
    req.set_expected_barcode(argv[3]);
    if (argc >= 5) req.set_pieces_per_shipper(ParseInt(argv[4], "pieces_per_shipper"));
    if (argc >= 6) req.set_target_quantity(ParseInt(argv[5], "target_quantity"));
    if (argc >= 7) req.set_job_id(argv[6]);

    StartJobResponse resp;
    return Print(client.StartJob(req, &resp), resp);
  }

  if (cmd == "scan") {
    if (argc < 4) return 1;

    ProcessScanRequest req;
    req.set_barcode(argv[3]);

    ProcessScanResponse resp;
    return Print(client.ProcessScan(req, &resp), resp);
  }

  if (cmd == "end") {
    if (argc < 4) return 1;

    EndJobRequest req;
    req.set_pin(argv[3]);

    EndJobResponse resp;
    uint64_t       retry_after = 0;
    auto           status      = client.EndJob(req, &resp, &retry_after);
    return Print(status, resp, retry_after);
  }

  if (cmd == "verify-pin") {
    if (argc < 4) return 1;

    VerifyPinRequest req;
    req.set_pin(argv[3]);

    VerifyPinResponse resp;
    uint64_t          retry_after = 0;
    auto              status      = client.VerifyPin(req, &resp, &retry_after);
    return Print(status, resp, retry_after);
  }

  if (cmd == "hourly") {
    GetHourlyStatsRequest req;
    if (argc >= 4) req.set_date(argv[3]);

    GetHourlyStatsResponse resp;
    return Print(client.GetHourlyStats(req, &resp), resp);
  }

  if (cmd == "job") {
    if (argc < 4) return 1;

    GetJobRequest req;
    req.set_job_id(argv[3]);
    if (argc >= 5) req.set_scan_limit(static_cast<uint32_t>(ParseInt(argv[4], "scan_limit")));

    GetJobResponse resp;
    return Print(client.GetJob(req, &resp), resp);
  }

  if (cmd == "jobs") {
    ListJobsRequest req;
    if (argc >= 4) req.set_page(static_cast<uint32_t>(ParseInt(argv[3], "page")));
    if (argc >= 5) req.set_page_size(static_cast<uint32_t>(ParseInt(argv[4], "page_size")));

    ListJobsResponse resp;
    return Print(client.ListJobs(req, &resp), resp);
  }

  if (cmd == "watch") {
    return Watch(client);
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    ExportStateResponse resp;
    auto                status = client.ExportState(&resp);
    if (!status.ok() || argc < 4) {
      return Print(status, resp);
    }

    std::ofstream out(argv[3]);
    if (!out) {
      std::cerr << "cannot write " << argv[3] << "\n";
      return 1;
    }
    out << ToJson(resp.snapshot());
    std::cout << "exported " << resp.snapshot().jobs_size() << " jobs, " << resp.snapshot().scans_size() << " scans to " << argv[3] << "\n";
    return 0;
  }

  if (cmd == "import") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot read " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ImportStateRequest req;
    auto               parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), req.mutable_snapshot());
    if (!parsed.ok()) {
      std::cerr << "invalid snapshot: " << parsed.message() << "\n";
      return 1;
    }

    ImportStateResponse resp;
    return Print(client.ImportState(req, &resp), resp);
  }

  Usage();
  return 1;
}
