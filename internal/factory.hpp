#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/line_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace linecheck::factory {

/*
  Application

  Owns every long-lived component of the daemon. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  service::ServiceContext                       context;
  std::shared_ptr<service::LineService>         line_service;
  std::shared_ptr<service::AdminService>        admin_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete repository and
  device types. Hydrates the job cache before returning. A null clock
  means the system clock.
*/
Application Build(const linecheck::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock = nullptr);

} // namespace linecheck::factory
