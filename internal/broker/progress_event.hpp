#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/task.hpp"

namespace codereview::broker {

enum class EventType {
  kStageUpdate,
  kCompleted,
  kFailed,
};

constexpr std::string_view EventTypeName(EventType type) {
  switch (type) {
    case EventType::kStageUpdate:
      return "stage_update";
    case EventType::kCompleted:
      return "completed";
    case EventType::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  One progress notification for one task.

  stage/status/progress are set on stage updates; task carries the full
  record on completion; error is set on failure.
*/
struct ProgressEvent {
  std::string                       task_id;
  EventType                         type = EventType::kStageUpdate;
  std::optional<model::Stage>       stage;
  std::optional<model::StageStatus> status;
  std::optional<double>             progress;
  double                            overall_progress = 0.0;
  std::string                       message;
  std::optional<model::Task>        task;
  std::optional<model::TaskError>   error;
  util::TimePoint                   emitted_at{};
};

// Built from the snapshot returned by the store so every field is
// consistent with one committed state.
ProgressEvent StageUpdateEvent(const model::Task& snapshot, model::Stage stage);
ProgressEvent CompletedEvent(const model::Task& snapshot);
ProgressEvent FailedEvent(const model::Task& snapshot);

} // namespace codereview::broker
