#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/review_client.h"
#include "codereview/v1.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: review_example <file_path> [endpoint]\n";
    return 1;
  }

  const std::filesystem::path path(argv[1]);
  const std::string           target = argc > 2 ? argv[2] : "localhost:50051";

  codereview::client::ReviewClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);

  // Create and start in one call, then follow the stream to the end.
  auto created = client.CreateTask(path.filename().string(), path.string(), ec ? 0 : static_cast<uint64_t>(size), {}, true);
  if (!created.ok()) {
    std::cerr << "CreateTask failed: " << created.status().ToString() << '\n';
    return 1;
  }

  const auto task_id = created.ValueOrDie().id();
  std::cout << "task " << task_id << " created\n";

  auto finished = client.Watch(task_id, [](const codereview::v1::ProgressEvent& event) {
    std::cout << codereview::v1::Stage_Name(event.stage()) << " " << codereview::v1::StageStatus_Name(event.status()) << " overall="
              << event.overall_progress() << "% " << event.message() << '\n';
  });
  if (!finished.ok()) {
    std::cerr << "Watch failed: " << finished.status().ToString() << '\n';
    return 1;
  }

  const auto& task = finished.ValueOrDie();
  if (task.status() == codereview::v1::TASK_STATUS_FAILED) {
    std::cerr << "review failed: " << task.error().message() << '\n';
    return 2;
  }

  const auto& diff = task.result().diff();
  std::cout << "saved to " << task.result().saved_file_path() << '\n';
  std::cout << "diff: +" << diff.lines_added() << " -" << diff.lines_removed() << " =" << diff.lines_unchanged() << '\n';
  for (const auto& report : task.result().reports()) {
    std::cout << "== " << codereview::v1::Stage_Name(report.stage()) << " ==\n" << report.report() << '\n';
  }

  return 0;
}
