#pragma once

#include <chrono>
#include <memory>

namespace codereview::core { class TaskStore; class TaskOrchestrator; }
namespace codereview::broker { class ProgressBroker; }

namespace codereview::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<codereview::core::TaskStore> store;
  std::shared_ptr<codereview::core::TaskOrchestrator> orchestrator;
  std::shared_ptr<codereview::broker::ProgressBroker> broker;
};

}
