#pragma once

#include <memory>
#include <string>

#include "codereview/v1/review_service.pb.h"
#include "internal/model/task.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/subscription.hpp"

namespace codereview::service {

class ReviewService {
public:
  explicit ReviewService(ServiceContext ctx);

  codereview::v1::CreateTaskResponse
  CreateTask(const codereview::v1::CreateTaskRequest& req);

  codereview::v1::StartTaskResponse
  StartTask(const codereview::v1::StartTaskRequest& req);

  codereview::v1::GetTaskResponse
  GetTask(const codereview::v1::GetTaskRequest& req);

  codereview::v1::ListTasksResponse
  ListTasks(const codereview::v1::ListTasksRequest& req);

  struct SubscribeResult {
    std::shared_ptr<Subscription> subscription;
    // Taken after registration, so no later event is missed.
    model::Task snapshot;
  };

  // Throws util::TaskNotFound. An empty client id gets a generated one.
  SubscribeResult Subscribe(const codereview::v1::SubscribeRequest& req);

  // Refreshes the subscriber's activity; false once it was dropped.
  bool Heartbeat(const Subscription& subscription);

  void Unsubscribe(const Subscription& subscription);

private:
  ServiceContext ctx_;
};

}
