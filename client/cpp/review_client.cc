#include "client/cpp/review_client.h"

#include <string>
#include <string_view>

#include <grpcpp/client_context.h>

namespace codereview::client {

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
  }
  if (status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT || status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION) {
    return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

bool IsTerminal(const codereview::v1::ProgressEvent& event) {
  return event.event_type() == codereview::v1::EVENT_TYPE_COMPLETED || event.event_type() == codereview::v1::EVENT_TYPE_FAILED;
}

bool IsTerminal(codereview::v1::TaskStatus status) {
  return status == codereview::v1::TASK_STATUS_COMPLETED || status == codereview::v1::TASK_STATUS_FAILED;
}

} // namespace

ReviewClient::ReviewClient(std::shared_ptr<::grpc::Channel> channel) : stub_(codereview::v1::ReviewService::NewStub(std::move(channel))) {}

arrow::Result<codereview::v1::Task> ReviewClient::CreateTask(const std::string& file_name, const std::string& file_path, uint64_t file_size,
                                                             const std::map<std::string, std::string>& options, bool auto_start) const {
  codereview::v1::CreateTaskRequest req;
  req.set_file_name(file_name);
  req.set_file_path(file_path);
  req.set_file_size(file_size);
  req.set_auto_start(auto_start);
  for (const auto& [key, value] : options) {
    (*req.mutable_options())[key] = value;
  }

  codereview::v1::CreateTaskResponse resp;
  ::grpc::ClientContext                ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CreateTask(&ctx, req, &resp), "CreateTask"));
  return resp.task();
}

arrow::Result<codereview::v1::Task> ReviewClient::StartTask(const std::string& task_id) const {
  codereview::v1::StartTaskRequest req;
  req.set_task_id(task_id);

  codereview::v1::StartTaskResponse resp;
  ::grpc::ClientContext               ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->StartTask(&ctx, req, &resp), "StartTask"));
  return resp.task();
}

arrow::Result<codereview::v1::Task> ReviewClient::GetTask(const std::string& task_id) const {
  codereview::v1::GetTaskRequest req;
  req.set_task_id(task_id);

  codereview::v1::GetTaskResponse resp;
  ::grpc::ClientContext             ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetTask(&ctx, req, &resp), "GetTask"));
  return resp.task();
}

arrow::Result<codereview::v1::ListTasksResponse> ReviewClient::ListTasks(uint32_t offset, uint32_t limit) const {
  codereview::v1::ListTasksRequest req;
  req.set_offset(offset);
  req.set_limit(limit);

  codereview::v1::ListTasksResponse resp;
  ::grpc::ClientContext               ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListTasks(&ctx, req, &resp), "ListTasks"));
  return resp;
}

std::unique_ptr<::grpc::ClientReader<codereview::v1::ProgressEvent>> ReviewClient::Subscribe(const codereview::v1::SubscribeRequest& request,
                                                                                           ::grpc::ClientContext*                    context) const {
  return stub_->Subscribe(context, request);
}

arrow::Result<codereview::v1::Task> ReviewClient::Watch(const std::string& task_id, const EventCallback& on_event) const {
  codereview::v1::SubscribeRequest req;
  req.set_task_id(task_id);

  ::grpc::ClientContext ctx;
  auto                reader = stub_->Subscribe(&ctx, req);

  codereview::v1::ProgressEvent event;
  codereview::v1::Task          last;
  bool                          terminal = false;
  while (reader->Read(&event)) {
    if (event.event_type() == codereview::v1::EVENT_TYPE_HEARTBEAT) {
      continue;
    }
    if (on_event) {
      on_event(event);
    }
    if (event.has_task()) {
      last = event.task();
    }
    if (IsTerminal(event) || (event.event_type() == codereview::v1::EVENT_TYPE_SNAPSHOT && IsTerminal(last.status()))) {
      terminal = true;
    }
  }

  ARROW_RETURN_NOT_OK(GrpcToArrow(reader->Finish(), "Subscribe"));
  if (!terminal) {
    return arrow::Status::IOError("Subscribe ended before task ", task_id, " finished");
  }

  // FAILED events carry no task record; fetch the final state.
  if (last.id().empty() || !IsTerminal(last.status())) {
    return GetTask(task_id);
  }
  return last;
}

} // namespace codereview::client
