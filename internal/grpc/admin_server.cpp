#include "admin_server.hpp"

#include <string_view>

#include "grpc_error.hpp"
#include "internal/lock/line_lock_guard.hpp"
#include "internal/observability/logging.hpp"

namespace linecheck::grpc {

using namespace linecheck::v1;

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

} // namespace

AdminServer::AdminServer(std::shared_ptr<linecheck::service::AdminService> svc, std::string admin_token)
    : service_(std::move(svc)), admin_token_(std::move(admin_token)) {
}

::grpc::Status AdminServer::Authorize(const ::grpc::ServerContext& ctx) const {
  if (admin_token_.empty()) {
    return {::grpc::StatusCode::PERMISSION_DENIED, "state import is disabled: no admin token configured"};
  }

  const auto& metadata = ctx.client_metadata();
  const auto  it       = metadata.find("authorization");
  if (it == metadata.end()) {
    return {::grpc::StatusCode::UNAUTHENTICATED, "missing authorization metadata"};
  }

  const std::string_view value(it->second.data(), it->second.length());
  if (value.substr(0, kBearerPrefix.size()) != kBearerPrefix ||
      !linecheck::lock::ConstantTimeEquals(value.substr(kBearerPrefix.size()), admin_token_)) {
    LINECHECK_LOG_WARN("admin authorization rejected", {observability::StringField("peer", ctx.peer())});
    return {::grpc::StatusCode::UNAUTHENTICATED, "invalid admin token"};
  }
  return ::grpc::Status::OK;
}

::grpc::Status AdminServer::ExportState(::grpc::ServerContext* ctx, const ExportStateRequest* req, ExportStateResponse* resp) {
  try {
    *resp = service_->ExportState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::ImportState(::grpc::ServerContext* ctx, const ImportStateRequest* req, ImportStateResponse* resp) {
  if (auto denied = Authorize(*ctx); !denied.ok()) {
    return denied;
  }
  try {
    *resp = service_->ImportState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace linecheck::grpc
