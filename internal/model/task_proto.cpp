#include "task_proto.hpp"

#include "internal/util/errors.hpp"

namespace codereview::model {

namespace pb = codereview::v1;

pb::Stage ToProto(Stage stage) {
  switch (stage) {
    case Stage::kArchitect:
      return pb::STAGE_ARCHITECT;
    case Stage::kReviewer:
      return pb::STAGE_REVIEWER;
    case Stage::kOptimizer:
      return pb::STAGE_OPTIMIZER;
    case Stage::kSave:
      return pb::STAGE_SAVE;
  }
  return pb::STAGE_UNSPECIFIED;
}

pb::StageStatus ToProto(StageStatus status) {
  switch (status) {
    case StageStatus::kIdle:
      return pb::STAGE_STATUS_IDLE;
    case StageStatus::kRunning:
      return pb::STAGE_STATUS_RUNNING;
    case StageStatus::kCompleted:
      return pb::STAGE_STATUS_COMPLETED;
    case StageStatus::kFailed:
      return pb::STAGE_STATUS_FAILED;
  }
  return pb::STAGE_STATUS_UNSPECIFIED;
}

pb::TaskStatus ToProto(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return pb::TASK_STATUS_PENDING;
    case TaskStatus::kRunning:
      return pb::TASK_STATUS_RUNNING;
    case TaskStatus::kCompleted:
      return pb::TASK_STATUS_COMPLETED;
    case TaskStatus::kFailed:
      return pb::TASK_STATUS_FAILED;
  }
  return pb::TASK_STATUS_UNSPECIFIED;
}

Stage FromProto(pb::Stage stage) {
  switch (stage) {
    case pb::STAGE_ARCHITECT:
      return Stage::kArchitect;
    case pb::STAGE_REVIEWER:
      return Stage::kReviewer;
    case pb::STAGE_OPTIMIZER:
      return Stage::kOptimizer;
    case pb::STAGE_SAVE:
      return Stage::kSave;
    default:
      throw util::InvalidArgument("unknown stage " + std::to_string(static_cast<int>(stage)));
  }
}

StageStatus FromProto(pb::StageStatus status) {
  switch (status) {
    case pb::STAGE_STATUS_IDLE:
      return StageStatus::kIdle;
    case pb::STAGE_STATUS_RUNNING:
      return StageStatus::kRunning;
    case pb::STAGE_STATUS_COMPLETED:
      return StageStatus::kCompleted;
    case pb::STAGE_STATUS_FAILED:
      return StageStatus::kFailed;
    default:
      throw util::InvalidArgument("unknown stage status " + std::to_string(static_cast<int>(status)));
  }
}

TaskStatus FromProto(pb::TaskStatus status) {
  switch (status) {
    case pb::TASK_STATUS_PENDING:
      return TaskStatus::kPending;
    case pb::TASK_STATUS_RUNNING:
      return TaskStatus::kRunning;
    case pb::TASK_STATUS_COMPLETED:
      return TaskStatus::kCompleted;
    case pb::TASK_STATUS_FAILED:
      return TaskStatus::kFailed;
    default:
      throw util::InvalidArgument("unknown task status " + std::to_string(static_cast<int>(status)));
  }
}

void ToProto(const StageReport& report, pb::StageReport* out) {
  out->set_stage(ToProto(report.stage));
  out->set_report(report.report);
  out->set_artifact_path(report.artifact_path);
  for (const auto& [key, value] : report.metrics) {
    (*out->mutable_metrics())[key] = value;
  }
}

StageReport FromProto(const pb::StageReport& report) {
  StageReport out;
  out.stage         = FromProto(report.stage());
  out.report        = report.report();
  out.artifact_path = report.artifact_path();
  for (const auto& [key, value] : report.metrics()) {
    out.metrics.emplace(key, value);
  }
  return out;
}

pb::Task ToProto(const Task& task) {
  pb::Task out;
  out.set_id(task.id);
  out.set_file_name(task.file_name);
  out.set_file_path(task.file_path);
  out.set_file_size(task.file_size);
  for (const auto& [key, value] : task.options) {
    (*out.mutable_options())[key] = value;
  }

  out.set_status(ToProto(task.status));
  out.set_stage_cursor(task.stage_cursor);
  out.set_overall_progress(task.overall_progress);

  for (const auto& state : task.stage_states) {
    auto* s = out.add_stage_states();
    s->set_stage(ToProto(state.stage));
    s->set_status(ToProto(state.status));
    s->set_message(state.message);
    s->set_progress(state.progress);
    *s->mutable_updated_at() = util::ToProto(state.updated_at);
  }

  if (task.result) {
    auto* r = out.mutable_result();
    r->set_original_content(task.result->original_content);
    r->set_fixed_content(task.result->fixed_content);
    r->set_saved_file_path(task.result->saved_file_path);
    for (const auto& report : task.result->reports) {
      ToProto(report, r->add_reports());
    }
    r->mutable_diff()->set_lines_added(task.result->diff.lines_added);
    r->mutable_diff()->set_lines_removed(task.result->diff.lines_removed);
    r->mutable_diff()->set_lines_unchanged(task.result->diff.lines_unchanged);
  }

  if (task.error) {
    out.mutable_error()->set_stage(ToProto(task.error->stage));
    out.mutable_error()->set_message(task.error->message);
  }

  *out.mutable_created_at() = util::ToProto(task.created_at);
  *out.mutable_updated_at() = util::ToProto(task.updated_at);
  if (task.started_at) {
    *out.mutable_started_at() = util::ToProto(*task.started_at);
  }
  if (task.completed_at) {
    *out.mutable_completed_at() = util::ToProto(*task.completed_at);
  }
  return out;
}

Task FromProto(const pb::Task& task) {
  if (task.stage_states_size() != static_cast<int>(kStageCount)) {
    throw util::InvalidArgument("task " + task.id() + " has " + std::to_string(task.stage_states_size()) + " stage states");
  }

  Task out;
  out.id        = task.id();
  out.file_name = task.file_name();
  out.file_path = task.file_path();
  out.file_size = task.file_size();
  for (const auto& [key, value] : task.options()) {
    out.options.emplace(key, value);
  }

  out.status           = FromProto(task.status());
  out.stage_cursor     = task.stage_cursor();
  out.overall_progress = task.overall_progress();

  for (const auto& s : task.stage_states()) {
    const auto stage = FromProto(s.stage());
    auto&      state = out.stage_states[StageIndex(stage)];
    state.stage      = stage;
    state.status     = FromProto(s.status());
    state.message    = s.message();
    state.progress   = s.progress();
    state.updated_at = util::FromProto(s.updated_at());
  }

  if (task.has_result()) {
    TaskResult r;
    r.original_content = task.result().original_content();
    r.fixed_content    = task.result().fixed_content();
    r.saved_file_path  = task.result().saved_file_path();
    for (const auto& report : task.result().reports()) {
      r.reports.push_back(FromProto(report));
    }
    r.diff.lines_added     = task.result().diff().lines_added();
    r.diff.lines_removed   = task.result().diff().lines_removed();
    r.diff.lines_unchanged = task.result().diff().lines_unchanged();
    out.result             = std::move(r);
  }

  if (task.has_error()) {
    out.error = TaskError{FromProto(task.error().stage()), task.error().message()};
  }

  out.created_at = util::FromProto(task.created_at());
  out.updated_at = util::FromProto(task.updated_at());
  if (task.has_started_at()) {
    out.started_at = util::FromProto(task.started_at());
  }
  if (task.has_completed_at()) {
    out.completed_at = util::FromProto(task.completed_at());
  }
  return out;
}

} // namespace codereview::model
