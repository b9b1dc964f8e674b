#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace linecheck::grpc {

inline constexpr char kRetryAfterKey[] = "retry-after";

/*
  Converts internal exceptions into gRPC status codes.

  When a ServerContext is given, a RateLimitedError also sets the
  "retry-after" trailer (whole seconds).
*/
::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx = nullptr);

} // namespace linecheck::grpc
