#pragma once

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "codereview/v1/review_service.grpc.pb.h"
#include "internal/service/review_service.hpp"

namespace codereview::grpc {

class ReviewServer final : public codereview::v1::ReviewService::Service {
public:
  ReviewServer(std::shared_ptr<codereview::service::ReviewService> svc,
               std::chrono::milliseconds heartbeat_interval);

  ::grpc::Status CreateTask(::grpc::ServerContext*,
                            const codereview::v1::CreateTaskRequest*,
                            codereview::v1::CreateTaskResponse*) override;

  ::grpc::Status StartTask(::grpc::ServerContext*,
                           const codereview::v1::StartTaskRequest*,
                           codereview::v1::StartTaskResponse*) override;

  ::grpc::Status GetTask(::grpc::ServerContext*,
                         const codereview::v1::GetTaskRequest*,
                         codereview::v1::GetTaskResponse*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*,
                           const codereview::v1::ListTasksRequest*,
                           codereview::v1::ListTasksResponse*) override;

  ::grpc::Status Subscribe(::grpc::ServerContext*,
                           const codereview::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<codereview::v1::ProgressEvent>*) override;

private:
  std::shared_ptr<codereview::service::ReviewService> service_;
  std::chrono::milliseconds heartbeat_interval_;
};

} // namespace codereview::grpc
