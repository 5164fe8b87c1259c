#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "codereview/v1.hpp"
#include "internal/broker/progress_broker.hpp"
#include "internal/core/task_orchestrator.hpp"
#include "internal/core/task_store.hpp"
#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/service/review_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using codereview::model::Stage;

class NoSources final : public codereview::storage::SourceStore {
 public:
  std::string Load(const std::string& file_path) override {
    throw std::runtime_error("no such file: " + file_path);
  }
  std::string SaveFixed(const std::string&, const std::string&, const std::string&) override {
    throw std::runtime_error("read-only");
  }
};

codereview::service::ServiceContext BuildServiceContext() {
  codereview::service::ServiceContext ctx;
  ctx.store        = std::make_shared<codereview::core::TaskStore>(std::make_shared<codereview::db::memory::MemoryTaskRepository>());
  ctx.broker       = std::make_shared<codereview::broker::ProgressBroker>();
  // nothing to read: a started task fails in its first stage
  ctx.orchestrator = std::make_shared<codereview::core::TaskOrchestrator>(ctx.store, ctx.broker, std::make_shared<NoSources>(),
                                                                          codereview::stage::StageRunners{});
  return ctx;
}

void TestErrorTaxonomyMapsToStatusCodes() {
  using codereview::grpc::ToStatus;

  assert(ToStatus(codereview::util::TaskNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(codereview::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(codereview::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(codereview::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(codereview::util::StageError(Stage::kSave, "x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(codereview::util::TaskNotFound("task not found: abc"));
  assert(status.error_message() == "task not found: abc");
}

void TestGetMissingTaskReturnsNotFound() {
  auto ctx = BuildServiceContext();
  codereview::grpc::ReviewServer server(std::make_shared<codereview::service::ReviewService>(ctx), std::chrono::seconds(1));

  codereview::v1::GetTaskRequest req;
  req.set_task_id("missing-task");
  codereview::v1::GetTaskResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.GetTask(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptyIdsReturnInvalidArgument() {
  auto ctx = BuildServiceContext();
  codereview::grpc::ReviewServer server(std::make_shared<codereview::service::ReviewService>(ctx), std::chrono::seconds(1));

  codereview::v1::CreateTaskRequest  create;
  codereview::v1::CreateTaskResponse create_resp;
  ::grpc::ServerContext              create_ctx;
  assert(server.CreateTask(&create_ctx, &create, &create_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  codereview::v1::StartTaskRequest  start;
  codereview::v1::StartTaskResponse start_resp;
  ::grpc::ServerContext             start_ctx;
  assert(server.StartTask(&start_ctx, &start, &start_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestStartingTwiceReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  codereview::grpc::ReviewServer server(std::make_shared<codereview::service::ReviewService>(ctx), std::chrono::seconds(1));

  codereview::v1::CreateTaskRequest create;
  create.set_file_name("a.cpp");
  create.set_file_path("/src/a.cpp");
  codereview::v1::CreateTaskResponse create_resp;
  ::grpc::ServerContext              create_ctx;
  assert(server.CreateTask(&create_ctx, &create, &create_resp).ok());
  assert(create_resp.task().status() == codereview::v1::TASK_STATUS_PENDING);
  assert(create_resp.task().stage_states_size() == 4);

  codereview::v1::StartTaskRequest start;
  start.set_task_id(create_resp.task().id());

  codereview::v1::StartTaskResponse first_resp;
  ::grpc::ServerContext             first_ctx;
  assert(server.StartTask(&first_ctx, &start, &first_resp).ok());
  assert(first_resp.task().status() == codereview::v1::TASK_STATUS_RUNNING);

  codereview::v1::StartTaskResponse second_resp;
  ::grpc::ServerContext             second_ctx;
  assert(server.StartTask(&second_ctx, &start, &second_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  ctx.orchestrator->WaitIdle();
  assert(ctx.store->Get(create_resp.task().id()).status == codereview::model::TaskStatus::kFailed);
}

void TestListTasksPagesNewestFirst() {
  auto ctx = BuildServiceContext();
  codereview::grpc::ReviewServer server(std::make_shared<codereview::service::ReviewService>(ctx), std::chrono::seconds(1));

  for (int i = 0; i < 3; ++i) {
    ctx.store->Create("f" + std::to_string(i) + ".cpp", "/src/f.cpp", 1);
  }

  codereview::v1::ListTasksRequest req;
  req.set_limit(2);
  codereview::v1::ListTasksResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  assert(server.ListTasks(&grpc_ctx, &req, &resp).ok());
  assert(resp.tasks_size() == 2);
  assert(resp.total() == 3);
}

} // namespace

int main() {
  TestErrorTaxonomyMapsToStatusCodes();
  TestGetMissingTaskReturnsNotFound();
  TestEmptyIdsReturnInvalidArgument();
  TestStartingTwiceReturnsFailedPrecondition();
  TestListTasksPagesNewestFirst();

  std::cout << "codereview_unit_grpc_status: pass\n";
  return 0;
}
