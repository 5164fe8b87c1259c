#include "review_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "progress_codec.hpp"

namespace codereview::grpc {

using codereview::observability::StringField;
using codereview::service::Subscription;

ReviewServer::ReviewServer(std::shared_ptr<codereview::service::ReviewService> svc,
                           std::chrono::milliseconds heartbeat_interval)
    : service_(std::move(svc)), heartbeat_interval_(heartbeat_interval) {}

::grpc::Status ReviewServer::CreateTask(::grpc::ServerContext*,
                                        const codereview::v1::CreateTaskRequest* req,
                                        codereview::v1::CreateTaskResponse* resp) {
  try {
    *resp = service_->CreateTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReviewServer::StartTask(::grpc::ServerContext*,
                                       const codereview::v1::StartTaskRequest* req,
                                       codereview::v1::StartTaskResponse* resp) {
  try {
    *resp = service_->StartTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReviewServer::GetTask(::grpc::ServerContext*,
                                     const codereview::v1::GetTaskRequest* req,
                                     codereview::v1::GetTaskResponse* resp) {
  try {
    *resp = service_->GetTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReviewServer::ListTasks(::grpc::ServerContext*,
                                       const codereview::v1::ListTasksRequest* req,
                                       codereview::v1::ListTasksResponse* resp) {
  try {
    *resp = service_->ListTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

/*
  Stream layout:
      SNAPSHOT → (STAGE_UPDATE | HEARTBEAT)* → COMPLETED | FAILED

  Every write happens on this handler thread. The broker only enqueues
  into the Subscription, and closes it when the subscriber is dropped.
*/
::grpc::Status ReviewServer::Subscribe(::grpc::ServerContext* context,
                                       const codereview::v1::SubscribeRequest* req,
                                       ::grpc::ServerWriter<codereview::v1::ProgressEvent>* writer) {
  codereview::service::ReviewService::SubscribeResult subscribed;
  try {
    subscribed = service_->Subscribe(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  auto& subscription = *subscribed.subscription;

  if (!writer->Write(SnapshotEvent(subscribed.snapshot))) {
    service_->Unsubscribe(subscription);
    return {::grpc::StatusCode::UNAVAILABLE, "client went away"};
  }
  if (model::IsTerminal(subscribed.snapshot.status)) {
    service_->Unsubscribe(subscription);
    return ::grpc::Status::OK;
  }

  ::grpc::Status status = ::grpc::Status::OK;
  broker::ProgressEvent event;
  while (true) {
    if (context->IsCancelled()) {
      status = {::grpc::StatusCode::CANCELLED, "subscriber cancelled"};
      break;
    }

    const auto waited = subscription.Next(&event, heartbeat_interval_);
    if (waited == Subscription::WaitResult::kClosed) {
      status = {::grpc::StatusCode::UNAVAILABLE, "subscription closed by server"};
      break;
    }

    if (waited == Subscription::WaitResult::kTimeout) {
      if (!writer->Write(HeartbeatEvent(subscription.TaskId()))) {
        status = {::grpc::StatusCode::UNAVAILABLE, "heartbeat write failed"};
        break;
      }
      service_->Heartbeat(subscription);
      continue;
    }

    if (!writer->Write(ToProto(event))) {
      status = {::grpc::StatusCode::UNAVAILABLE, "event write failed"};
      break;
    }
    if (IsTerminal(event)) {
      break;
    }
  }

  service_->Unsubscribe(subscription);
  if (!status.ok()) {
    CODEREVIEW_LOG_INFO("subscription ended", {StringField("task_id", subscription.TaskId()), StringField("client_id", subscription.ClientId()),
                                               StringField("reason", status.error_message())});
  }
  return status;
}

} // namespace codereview::grpc
