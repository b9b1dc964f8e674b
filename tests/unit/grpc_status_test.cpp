#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/line_server.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/line_fixture.hpp"

namespace {

using linecheck::grpc::AdminServer;
using linecheck::grpc::LineServer;
using linecheck::grpc::ToStatus;
using linecheck::testing::LineFixture;
using namespace linecheck::v1;

void TestErrorMapping() {
  using namespace linecheck::util;
  assert(ToStatus(ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidInputError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(ConflictError("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(NoActiveJobError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(LineLockedError("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(RateLimitedError("x", 5)).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(InvalidPinError("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(NotFoundError("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(PersistenceError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestScanWithoutJobReturnsFailedPrecondition() {
  LineFixture f;
  LineServer  server(f.line);

  ProcessScanRequest req;
  req.set_barcode("ABC123");
  ProcessScanResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ProcessScan(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestScanWhileLockedReturnsAborted() {
  LineFixture f;
  LineServer  server(f.line);
  f.Start("JOB-1", "ABC123");

  ProcessScanRequest req;
  req.set_barcode("WRONG");
  ProcessScanResponse resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.ProcessScan(&grpc_ctx, &req, &resp).ok());
    assert(resp.line().state() == LOCK_STATE_LOCKED);
  }

  req.set_barcode("ABC123");
  ::grpc::ServerContext grpc_ctx;
  assert(server.ProcessScan(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestStartJobStatuses() {
  LineFixture f;
  LineServer  server(f.line);

  StartJobRequest req;
  req.set_job_id("JOB-1");
  StartJobResponse resp;

  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.StartJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  req.set_expected_barcode("ABC123");
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.StartJob(&grpc_ctx, &req, &resp).ok());
    assert(resp.job().job().job_id() == "JOB-1");
  }

  req.set_job_id("JOB-2");
  ::grpc::ServerContext grpc_ctx;
  assert(server.StartJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestEndJobStatuses() {
  LineFixture f;
  LineServer  server(f.line);

  EndJobRequest req;
  req.set_pin("0000");
  EndJobResponse resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.EndJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  f.Start("JOB-1", "ABC123");
  ::grpc::ServerContext grpc_ctx;
  assert(server.EndJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestImportRequiresConfiguredToken() {
  LineFixture f;

  ImportStateRequest  req;
  ImportStateResponse resp;
  {
    AdminServer           disabled(f.admin, "");
    ::grpc::ServerContext grpc_ctx;
    assert(disabled.ImportState(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }

  AdminServer           server(f.admin, "token");
  ::grpc::ServerContext grpc_ctx;
  assert(server.ImportState(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // export stays open
  ExportStateRequest    export_req;
  ExportStateResponse   exported;
  ::grpc::ServerContext export_ctx;
  assert(server.ExportState(&export_ctx, &export_req, &exported).ok());
  assert(exported.snapshot().format_version() == linecheck::service::kSnapshotFormatVersion);
}

} // namespace

int main() {
  TestErrorMapping();
  TestScanWithoutJobReturnsFailedPrecondition();
  TestScanWhileLockedReturnsAborted();
  TestStartJobStatuses();
  TestEndJobStatuses();
  TestImportRequiresConfiguredToken();

  std::cout << "linecheck_unit_grpc_status: pass\n";
  return 0;
}
