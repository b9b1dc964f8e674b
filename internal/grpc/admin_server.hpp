#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "internal/service/admin_service.hpp"
#include "linecheck/v1/admin_service.grpc.pb.h"

namespace linecheck::grpc {

/*
  AdminService transport. ImportState requires
  "authorization: Bearer <token>" metadata; with no token configured it
  is refused outright.
*/
class AdminServer final : public linecheck::v1::AdminService::Service {
 public:
  AdminServer(std::shared_ptr<linecheck::service::AdminService> svc, std::string admin_token);

  ::grpc::Status ExportState(::grpc::ServerContext*, const linecheck::v1::ExportStateRequest*, linecheck::v1::ExportStateResponse*) override;

  ::grpc::Status ImportState(::grpc::ServerContext*, const linecheck::v1::ImportStateRequest*, linecheck::v1::ImportStateResponse*) override;

 private:
  ::grpc::Status Authorize(const ::grpc::ServerContext& ctx) const;

  std::shared_ptr<linecheck::service::AdminService> service_;
  std::string                                       admin_token_;
};

} // namespace linecheck::grpc
