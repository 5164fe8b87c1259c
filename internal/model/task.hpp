#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/stage.hpp"
#include "internal/util/time.hpp"

namespace codereview::model {

struct StageState {
  Stage           stage  = Stage::kArchitect;
  StageStatus     status = StageStatus::kIdle;
  std::string     message;
  double          progress = 0.0;
  util::TimePoint updated_at{};
};

// Output of one completed stage as recorded on the task.
struct StageReport {
  Stage                         stage = Stage::kArchitect;
  std::string                   report;
  std::map<std::string, double> metrics;
  std::string                   artifact_path;
};

struct DiffSummary {
  uint64_t lines_added     = 0;
  uint64_t lines_removed   = 0;
  uint64_t lines_unchanged = 0;
};

struct TaskResult {
  std::string              original_content;
  std::string              fixed_content;
  std::vector<StageReport> reports;
  DiffSummary              diff;
  std::string              saved_file_path;
};

struct TaskError {
  Stage       stage = Stage::kArchitect;
  std::string message;
};

using StageStates = std::array<StageState, kStageCount>;

/*
  Authoritative task record.

  Invariants (maintained by TaskStore):
    - stage_states always holds every stage, in pipeline order
    - stage_cursor never decreases
    - overall_progress == OverallProgress(stage_states)
    - result is set only when Completed, error only when Failed
*/
struct Task {
  std::string                        id;
  std::string                        file_name;
  std::string                        file_path;
  uint64_t                           file_size = 0;
  std::map<std::string, std::string> options;

  TaskStatus  status           = TaskStatus::kPending;
  uint32_t    stage_cursor     = 0;
  double      overall_progress = 0.0;
  StageStates stage_states{};

  std::optional<TaskResult> result;
  std::optional<TaskError>  error;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
};

StageStates InitialStageStates(util::TimePoint now);

std::size_t CompletedStages(const StageStates& states);

// completed_stages / total_stages * 100
double OverallProgress(const StageStates& states);

Task NewTask(std::string id, std::string file_name, std::string file_path, uint64_t file_size,
             std::map<std::string, std::string> options, util::TimePoint now);

} // namespace codereview::model
