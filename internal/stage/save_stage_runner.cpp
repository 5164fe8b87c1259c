#include "save_stage_runner.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codereview::stage {

using codereview::observability::StringField;

SaveStageRunner::SaveStageRunner(storage::SourceStorePtr store) : store_(std::move(store)) {
}

StageResult SaveStageRunner::Run(const StageContext& context) {
  if (context.current_content.empty()) {
    throw util::StageError(context.stage, "nothing to save: fixed content is empty");
  }

  const auto path  = store_->SaveFixed(context.task_id, context.file_name, context.current_content);
  auto lines = std::count(context.current_content.begin(), context.current_content.end(), '\n');
  if (context.current_content.back() != '\n') {
    ++lines;
  }

  StageResult result;
  result.report                = "saved fixed source to " + path;
  result.artifact_path         = path;
  result.metrics["bytes"]      = static_cast<double>(context.current_content.size());
  result.metrics["line_count"] = static_cast<double>(lines);

  CODEREVIEW_LOG_INFO("fixed source saved", {StringField("task_id", context.task_id), StringField("path", path),
                                             observability::IntField("bytes", static_cast<int64_t>(context.current_content.size()))});
  return result;
}

} // namespace codereview::stage
