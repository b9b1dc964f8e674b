#include "grpc_error.hpp"

#include <string>

namespace linecheck::grpc {

::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx) {
  using namespace linecheck::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ConflictError*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const NoActiveJobError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const LineLockedError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (const auto* limited = dynamic_cast<const RateLimitedError*>(&e)) {
    if (ctx) {
      ctx->AddTrailingMetadata(kRetryAfterKey, std::to_string(limited->RetryAfterSeconds()));
    }
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const InvalidPinError*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const NotFoundError*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace linecheck::grpc
