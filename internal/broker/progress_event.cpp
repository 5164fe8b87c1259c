#include "progress_event.hpp"

namespace codereview::broker {

ProgressEvent StageUpdateEvent(const model::Task& snapshot, model::Stage stage) {
  const auto& state = snapshot.stage_states[model::StageIndex(stage)];

  ProgressEvent event;
  event.task_id          = snapshot.id;
  event.type             = EventType::kStageUpdate;
  event.stage            = stage;
  event.status           = state.status;
  event.progress         = state.progress;
  event.overall_progress = snapshot.overall_progress;
  event.message          = state.message;
  event.emitted_at       = snapshot.updated_at;
  return event;
}

ProgressEvent CompletedEvent(const model::Task& snapshot) {
  ProgressEvent event;
  event.task_id          = snapshot.id;
  event.type             = EventType::kCompleted;
  event.overall_progress = snapshot.overall_progress;
  event.message          = "review completed";
  event.task             = snapshot;
  event.emitted_at       = snapshot.updated_at;
  return event;
}

ProgressEvent FailedEvent(const model::Task& snapshot) {
  ProgressEvent event;
  event.task_id          = snapshot.id;
  event.type             = EventType::kFailed;
  event.overall_progress = snapshot.overall_progress;
  event.error            = snapshot.error;
  if (snapshot.error) {
    event.stage   = snapshot.error->stage;
    event.status  = model::StageStatus::kFailed;
    event.message = snapshot.error->message;
  }
  event.emitted_at = snapshot.updated_at;
  return event;
}

} // namespace codereview::broker
