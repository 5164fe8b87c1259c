#pragma once

#include <array>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/task.hpp"

namespace codereview::stage {

/*
  Accumulated input for one stage.

  current_content is the newest version of the source: the original, or
  the fixed content of the latest stage that produced one.
*/
struct StageContext {
  std::string                        task_id;
  model::Stage                       stage = model::Stage::kArchitect;
  std::string                        file_name;
  std::string                        original_content;
  std::string                        current_content;
  std::vector<model::StageReport>    prior_reports;
  std::map<std::string, std::string> options;
};

struct StageResult {
  std::string                   report;
  std::map<std::string, double> metrics;
  // Set when the stage rewrote the source.
  std::string fixed_content;
  // Set when the stage produced a file.
  std::string artifact_path;
};

/*
  One analysis stage. Implementations throw util::StageError on failure;
  any other exception is wrapped by the orchestrator.
*/
class StageRunner {
 public:
  virtual ~StageRunner() = default;

  virtual StageResult Run(const StageContext& context) = 0;
};

using StageRunnerPtr = std::shared_ptr<StageRunner>;

// Indexed by model::StageIndex.
using StageRunners = std::array<StageRunnerPtr, model::kStageCount>;

} // namespace codereview::stage
