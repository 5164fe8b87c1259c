#include "task.hpp"

namespace codereview::model {

StageStates InitialStageStates(util::TimePoint now) {
  StageStates states{};
  for (const auto stage : kStageSequence) {
    auto& state      = states[StageIndex(stage)];
    state.stage      = stage;
    state.status     = StageStatus::kIdle;
    state.progress   = 0.0;
    state.updated_at = now;
  }
  return states;
}

std::size_t CompletedStages(const StageStates& states) {
  std::size_t completed = 0;
  for (const auto& state : states) {
    if (state.status == StageStatus::kCompleted) {
      ++completed;
    }
  }
  return completed;
}

double OverallProgress(const StageStates& states) {
  return static_cast<double>(CompletedStages(states)) / static_cast<double>(kStageCount) * 100.0;
}

Task NewTask(std::string id, std::string file_name, std::string file_path, uint64_t file_size,
             std::map<std::string, std::string> options, util::TimePoint now) {
  Task task;
  task.id               = std::move(id);
  task.file_name        = std::move(file_name);
  task.file_path        = std::move(file_path);
  task.file_size        = file_size;
  task.options          = std::move(options);
  task.status           = TaskStatus::kPending;
  task.stage_cursor     = 0;
  task.stage_states     = InitialStageStates(now);
  task.overall_progress = OverallProgress(task.stage_states);
  task.created_at       = now;
  task.updated_at       = now;
  return task;
}

} // namespace codereview::model
