#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/service/service_context.hpp"

namespace forecast::external {
class SimulatedExternalSystem;
}

namespace forecast::factory {

/*
  Application

  Owns every long-lived component of the daemon.
*/
struct Application {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<external::SimulatedExternalSystem> external_system;
  service::ServiceContext                           context;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<runtime::JobScheduler> scheduler;
};

/*
  Composition root. The only place that knows concrete backend types.
*/
Application Build(const forecast::runtime::config::RuntimeConfig& config);

} // namespace forecast::factory
