#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "codereview/v1.hpp"

using namespace codereview::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  reviewctl <addr> create <file_path> [--start] [key=value ...]\n"
            << "  reviewctl <addr> start <task_id>\n"
            << "  reviewctl <addr> get <task_id>\n"
            << "  reviewctl <addr> list [offset] [limit]\n"
            << "  reviewctl <addr> watch <task_id>\n";
}

static std::string StatusName(TaskStatus status) {
  return TaskStatus_Name(status);
}

static void PrintTask(const Task& task) {
  std::cout << "id=" << task.id() << "\n";
  std::cout << "file=" << task.file_name() << "\n";
  std::cout << "status=" << StatusName(task.status()) << "\n";
  std::cout << "progress=" << task.overall_progress() << "\n";
  for (const auto& state : task.stage_states()) {
    std::cout << "  " << Stage_Name(state.stage()) << " " << StageStatus_Name(state.status()) << " " << state.progress();
    if (!state.message().empty()) {
      std::cout << " " << state.message();
    }
    std::cout << "\n";
  }
  if (task.status() == TASK_STATUS_COMPLETED) {
    const auto& diff = task.result().diff();
    std::cout << "saved=" << task.result().saved_file_path() << "\n";
    std::cout << "diff=+" << diff.lines_added() << " -" << diff.lines_removed() << " =" << diff.lines_unchanged() << "\n";
  }
  if (task.status() == TASK_STATUS_FAILED) {
    std::cout << "error=" << task.error().message() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ReviewService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    const std::filesystem::path path(argv[3]);

    CreateTaskRequest req;
    req.set_file_name(path.filename().string());
    req.set_file_path(path.string());

    std::error_code ec;
    const auto      size = std::filesystem::file_size(path, ec);
    if (!ec) {
      req.set_file_size(static_cast<uint64_t>(size));
    }

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--start") {
        req.set_auto_start(true);
        continue;
      }
      const auto eq = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "invalid option (expected key=value): " << arg << "\n";
        return 1;
      }
      (*req.mutable_options())[arg.substr(0, eq)] = arg.substr(eq + 1);
    }

    CreateTaskResponse resp;

    auto status = stub->CreateTask(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "task=" << resp.task().id() << "\n";
    std::cout << "status=" << StatusName(resp.task().status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 4) return 1;

    StartTaskRequest req;
    req.set_task_id(argv[3]);

    StartTaskResponse resp;

    auto status = stub->StartTask(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << StatusName(resp.task().status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetTaskRequest req;
    req.set_task_id(argv[3]);

    GetTaskResponse resp;

    auto status = stub->GetTask(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintTask(resp.task());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListTasksRequest req;
    if (argc >= 4) req.set_offset(static_cast<uint32_t>(std::stoul(argv[3])));
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    ListTasksResponse resp;

    auto status = stub->ListTasks(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& task : resp.tasks()) {
      std::cout << task.id() << " " << StatusName(task.status()) << " " << task.overall_progress() << " " << task.file_name() << "\n";
    }
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) return 1;

    SubscribeRequest req;
    req.set_task_id(argv[3]);

    auto reader = stub->Subscribe(&ctx, req);

    ProgressEvent event;
    while (reader->Read(&event)) {
      if (event.event_type() == EVENT_TYPE_HEARTBEAT) {
        continue;
      }
      std::cout << EventType_Name(event.event_type()) << " " << Stage_Name(event.stage()) << " " << StageStatus_Name(event.status()) << " "
                << event.overall_progress() << " " << event.message() << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  Usage();
  return 1;
}
