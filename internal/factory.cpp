#include "factory.hpp"

#include <grpcpp/grpcpp.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "codereview/v1/stage_generator.grpc.pb.h"
#include "internal/broker/progress_broker.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/task_orchestrator.hpp"
#include "internal/core/task_store.hpp"
#include "internal/db/api/task_repository.hpp"
#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/service/review_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/stage/grpc_stage_runner.hpp"
#include "internal/stage/save_stage_runner.hpp"
#include "internal/storage/disk/disk_source_store.hpp"
#include "internal/util/time.hpp"
#if CODEREVIEW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_task_repository.hpp"
#endif

namespace codereview::factory {

using codereview::observability::IntField;
using codereview::observability::StringField;

namespace {

std::shared_ptr<db::TaskRepository> BuildRepository(const codereview::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CODEREVIEW_DB_SQLITE
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteTaskRepository>(std::move(sqlite_db));
    repository->Bootstrap();
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryTaskRepository>();
}

stage::StageRunners BuildRunners(const codereview::runtime::config::RuntimeConfig& config, storage::SourceStorePtr sources) {
  const auto deadline = util::ToMillis(config.generator().deadline(), config::kDefaultGeneratorDeadline);

  auto channel = ::grpc::CreateChannel(config.generator().endpoint(), ::grpc::InsecureChannelCredentials());
  std::shared_ptr<v1::StageGenerator::StubInterface> stub = v1::StageGenerator::NewStub(channel);

  stage::StageRunners runners;
  runners[model::StageIndex(model::Stage::kArchitect)] = std::make_shared<stage::GrpcStageRunner>(stub, deadline);
  runners[model::StageIndex(model::Stage::kReviewer)]  = std::make_shared<stage::GrpcStageRunner>(stub, deadline);
  runners[model::StageIndex(model::Stage::kOptimizer)] = std::make_shared<stage::GrpcStageRunner>(stub, deadline);
  runners[model::StageIndex(model::Stage::kSave)]      = std::make_shared<stage::SaveStageRunner>(std::move(sources));
  return runners;
}

} // namespace

void Application::Shutdown() {
  if (maintenance) {
    maintenance->Stop();
  }
  if (orchestrator) {
    orchestrator->Shutdown();
  }
  if (broker) {
    broker->CloseAll();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const codereview::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  app.store         = std::make_shared<core::TaskStore>(repository);
  const auto loaded = app.store->Hydrate();
  CODEREVIEW_LOG_INFO("Task store hydrated", {IntField("tasks", static_cast<std::int64_t>(loaded))});

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  auto sources = std::make_shared<storage::DiskSourceStore>(config.storage().fixed_dir());

  app.broker       = std::make_shared<broker::ProgressBroker>();
  app.orchestrator = std::make_shared<core::TaskOrchestrator>(app.store, app.broker, sources, BuildRunners(config, sources));

  CODEREVIEW_LOG_INFO("Stage generator configured", {StringField("endpoint", config.generator().endpoint()),
                                                     StringField("fixed_dir", config.storage().fixed_dir())});

  // ------------------------------------------------------------------
  // Housekeeping
  // ------------------------------------------------------------------
  runtime::MaintenanceWorker::Options maintenance_options;
  maintenance_options.interval     = util::ToMillis(config.maintenance().interval(), config::kDefaultMaintenanceInterval);
  maintenance_options.idle_timeout = util::ToMillis(config.subscribers().idle_timeout(), config::kDefaultIdleTimeout);
  maintenance_options.max_tasks    = static_cast<std::size_t>(config.retention().max_tasks());

  app.maintenance = std::make_shared<runtime::MaintenanceWorker>(app.broker, app.store, maintenance_options);
  app.maintenance->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store        = app.store;
  ctx.orchestrator = app.orchestrator;
  ctx.broker       = app.broker;

  auto review_service = std::make_shared<service::ReviewService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  const auto heartbeat = util::ToMillis(config.subscribers().heartbeat_interval(), config::kDefaultHeartbeatInterval);
  app.grpc_services.push_back(std::make_shared<grpc::ReviewServer>(review_service, heartbeat));

  return app;
}

} // namespace codereview::factory
