#include "review_service.hpp"

#include <algorithm>
#include <chrono>
#include <map>

#include "internal/broker/progress_broker.hpp"
#include "internal/core/task_orchestrator.hpp"
#include "internal/core/task_store.hpp"
#include "internal/model/task_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace codereview::service {

using namespace codereview::v1;

namespace {

constexpr uint32_t kDefaultPageSize = 50;
constexpr uint32_t kMaxPageSize     = 500;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* task_id, Fn&& fn) {
  codereview::observability::SpanScope span(route);
  if (task_id) {
    span.SetAttribute("task.id", *task_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    codereview::observability::Metrics::Instance().RecordRequest(route, true);
    codereview::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CODEREVIEW_LOG_WARN("RPC failed", {codereview::observability::StringField("route", route), codereview::observability::StringField("error", ex.what()),
                                       codereview::observability::StringField("task_id", task_id ? *task_id : std::string())});
    codereview::observability::Metrics::Instance().RecordRequest(route, false);
    codereview::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

void RequireTaskId(const std::string& task_id) {
  if (task_id.empty()) {
    throw codereview::util::InvalidArgument("task_id is required");
  }
}

} // namespace

ReviewService::ReviewService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateTaskResponse ReviewService::CreateTask(const CreateTaskRequest& req) {
  return ObserveRpc("ReviewService.CreateTask", nullptr, [&] {
    std::map<std::string, std::string> options;
    for (const auto& [key, value] : req.options()) {
      options.emplace(key, value);
    }

    auto task = ctx_.store->Create(req.file_name(), req.file_path(), req.file_size(), std::move(options));
    if (req.auto_start()) {
      task = ctx_.orchestrator->Start(task.id);
    }

    CreateTaskResponse resp;
    *resp.mutable_task() = model::ToProto(task);
    return resp;
  });
}

StartTaskResponse ReviewService::StartTask(const StartTaskRequest& req) {
  return ObserveRpc("ReviewService.StartTask", &req.task_id(), [&] {
    RequireTaskId(req.task_id());

    StartTaskResponse resp;
    *resp.mutable_task() = model::ToProto(ctx_.orchestrator->Start(req.task_id()));
    return resp;
  });
}

GetTaskResponse ReviewService::GetTask(const GetTaskRequest& req) {
  return ObserveRpc("ReviewService.GetTask", &req.task_id(), [&] {
    RequireTaskId(req.task_id());

    GetTaskResponse resp;
    *resp.mutable_task() = model::ToProto(ctx_.store->Get(req.task_id()));
    return resp;
  });
}

ListTasksResponse ReviewService::ListTasks(const ListTasksRequest& req) {
  return ObserveRpc("ReviewService.ListTasks", nullptr, [&] {
    const auto limit = req.limit() == 0 ? kDefaultPageSize : std::min(req.limit(), kMaxPageSize);

    ListTasksResponse resp;
    for (const auto& task : ctx_.store->List(req.offset(), limit)) {
      *resp.add_tasks() = model::ToProto(task);
    }
    resp.set_total(ctx_.store->Count());
    return resp;
  });
}

ReviewService::SubscribeResult ReviewService::Subscribe(const SubscribeRequest& req) {
  return ObserveRpc("ReviewService.Subscribe", &req.task_id(), [&] {
    RequireTaskId(req.task_id());
    if (!ctx_.store->Contains(req.task_id())) {
      throw codereview::util::TaskNotFound("task not found: " + req.task_id());
    }

    const auto client_id    = req.client_id().empty() ? codereview::util::GenerateId() : req.client_id();
    auto       subscription = std::make_shared<Subscription>(req.task_id(), client_id);

    broker::SubscriberHandle handle;
    handle.send  = [subscription](const broker::ProgressEvent& event) { return subscription->Push(event); };
    handle.close = [subscription] { subscription->Close(); };
    ctx_.broker->Register(req.task_id(), client_id, std::move(handle));

    SubscribeResult result;
    result.subscription = subscription;
    try {
      result.snapshot = ctx_.store->Get(req.task_id());
    } catch (const codereview::util::TaskNotFound&) {
      // retired between the check and the registration
      ctx_.broker->Unregister(req.task_id(), client_id);
      throw;
    }
    return result;
  });
}

bool ReviewService::Heartbeat(const Subscription& subscription) {
  return ctx_.broker->Touch(subscription.TaskId(), subscription.ClientId());
}

void ReviewService::Unsubscribe(const Subscription& subscription) {
  // a closed subscription was already removed (or replaced) by the broker
  if (!subscription.IsClosed()) {
    ctx_.broker->Unregister(subscription.TaskId(), subscription.ClientId());
  }
}

}
