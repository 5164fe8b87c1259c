#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/sync_stream.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "codereview/v1.hpp"

namespace codereview::client {

class ReviewClient {
 public:
  using EventCallback = std::function<void(const codereview::v1::ProgressEvent&)>;

  explicit ReviewClient(std::shared_ptr<::grpc::Channel> channel);

  arrow::Result<codereview::v1::Task> CreateTask(const std::string& file_name, const std::string& file_path, uint64_t file_size,
                                                 const std::map<std::string, std::string>& options = {}, bool auto_start = false) const;

  arrow::Result<codereview::v1::Task> StartTask(const std::string& task_id) const;

  arrow::Result<codereview::v1::Task> GetTask(const std::string& task_id) const;

  arrow::Result<codereview::v1::ListTasksResponse> ListTasks(uint32_t offset = 0, uint32_t limit = 0) const;

  std::unique_ptr<::grpc::ClientReader<codereview::v1::ProgressEvent>> Subscribe(const codereview::v1::SubscribeRequest& request,
                                                                               ::grpc::ClientContext*                    context) const;

  // Follows the task's progress stream until a terminal event arrives and
  // returns the final task. Heartbeats are not passed to on_event.
  arrow::Result<codereview::v1::Task> Watch(const std::string& task_id, const EventCallback& on_event = {}) const;

 private:
  std::unique_ptr<codereview::v1::ReviewService::Stub> stub_;
};

} // namespace codereview::client
