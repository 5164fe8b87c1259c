#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace codereview::core {
class TaskStore;
class TaskOrchestrator;
} // namespace codereview::core
namespace codereview::broker {
class ProgressBroker;
}
namespace codereview::runtime {
class MaintenanceWorker;
}

namespace codereview::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<codereview::core::TaskStore>          store;
  std::shared_ptr<codereview::broker::ProgressBroker>   broker;
  std::shared_ptr<codereview::core::TaskOrchestrator>   orchestrator;
  std::shared_ptr<codereview::runtime::MaintenanceWorker> maintenance;

  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

  // Stops background work in dependency order: maintenance, running
  // pipelines, then open subscriber streams.
  void Shutdown();
};

/*
  Build

  Constructs the entire backend from a finalized runtime config.

  This is the composition root of the application and the only place
  that knows concrete repository, storage and runner types.
*/
Application Build(const codereview::runtime::config::RuntimeConfig& config);

} // namespace codereview::factory
