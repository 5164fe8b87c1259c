#include "progress_codec.hpp"

#include "internal/model/task_proto.hpp"

namespace codereview::grpc {

namespace pb = codereview::v1;

namespace {

pb::EventType ToProto(broker::EventType type) {
  switch (type) {
    case broker::EventType::kStageUpdate:
      return pb::EVENT_TYPE_STAGE_UPDATE;
    case broker::EventType::kCompleted:
      return pb::EVENT_TYPE_COMPLETED;
    case broker::EventType::kFailed:
      return pb::EVENT_TYPE_FAILED;
  }
  return pb::EVENT_TYPE_UNSPECIFIED;
}

} // namespace

pb::ProgressEvent ToProto(const broker::ProgressEvent& event) {
  pb::ProgressEvent out;
  out.set_task_id(event.task_id);
  out.set_event_type(ToProto(event.type));
  if (event.stage) {
    out.set_stage(model::ToProto(*event.stage));
  }
  if (event.status) {
    out.set_status(model::ToProto(*event.status));
  }
  if (event.progress) {
    out.set_progress(*event.progress);
  }
  out.set_overall_progress(event.overall_progress);
  out.set_message(event.message);
  if (event.task) {
    *out.mutable_task() = model::ToProto(*event.task);
  }
  if (event.error) {
    out.mutable_error()->set_stage(model::ToProto(event.error->stage));
    out.mutable_error()->set_message(event.error->message);
  }
  *out.mutable_emitted_at() = util::ToProto(event.emitted_at);
  return out;
}

pb::ProgressEvent SnapshotEvent(const model::Task& task) {
  pb::ProgressEvent out;
  out.set_task_id(task.id);
  out.set_event_type(pb::EVENT_TYPE_SNAPSHOT);
  out.set_overall_progress(task.overall_progress);
  out.set_message(std::string(model::TaskStatusName(task.status)));
  *out.mutable_task()       = model::ToProto(task);
  *out.mutable_emitted_at() = util::ToProto(util::Now());
  return out;
}

pb::ProgressEvent HeartbeatEvent(const std::string& task_id) {
  pb::ProgressEvent out;
  out.set_task_id(task_id);
  out.set_event_type(pb::EVENT_TYPE_HEARTBEAT);
  *out.mutable_emitted_at() = util::ToProto(util::Now());
  return out;
}

bool IsTerminal(const broker::ProgressEvent& event) {
  return event.type == broker::EventType::kCompleted || event.type == broker::EventType::kFailed;
}

} // namespace codereview::grpc
