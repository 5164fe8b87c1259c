#include "task_orchestrator.hpp"

#include <chrono>
#include <exception>

#include "internal/core/diff_summary.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace codereview::core {

using codereview::observability::StringField;
using model::Stage;
using model::StageStatus;

namespace {

std::string StageSummary(Stage stage, const stage::StageResult& result) {
  if (!result.artifact_path.empty()) {
    return std::string(model::StageName(stage)) + " saved " + result.artifact_path;
  }
  return std::string(model::StageName(stage)) + " completed";
}

} // namespace

TaskOrchestrator::TaskOrchestrator(std::shared_ptr<TaskStore> store, std::shared_ptr<broker::ProgressBroker> broker, storage::SourceStorePtr sources,
                                   stage::StageRunners runners)
    : store_(std::move(store)), broker_(std::move(broker)), sources_(std::move(sources)), runners_(std::move(runners)) {
}

TaskOrchestrator::~TaskOrchestrator() {
  Shutdown();
}

void TaskOrchestrator::Publish(const broker::ProgressEvent& event) {
  broker_->Broadcast(event.task_id, event);
}

model::Task TaskOrchestrator::Run(const std::string& task_id) {
  const auto running = store_->BeginRun(task_id);
  return Execute(running);
}

model::Task TaskOrchestrator::Start(const std::string& task_id) {
  std::lock_guard lock(workers_mutex_);
  if (shutting_down_) {
    throw util::InvalidState("orchestrator is shutting down");
  }
  Reap();

  auto running = store_->BeginRun(task_id);

  workers_.emplace(task_id, std::thread([this, running] {
                     try {
                       Execute(running);
                     } catch (const std::exception& e) {
                       Abort(running.id, e.what());
                     } catch (...) {
                       Abort(running.id, "unknown exception");
                     }

                     std::lock_guard worker_lock(workers_mutex_);
                     finished_.push_back(running.id);
                     idle_cv_.notify_all();
                   }));
  return running;
}

void TaskOrchestrator::Reap() {
  for (const auto& id : finished_) {
    auto it = workers_.find(id);
    if (it == workers_.end()) {
      continue;
    }
    if (it->second.joinable()) {
      it->second.join();
    }
    workers_.erase(it);
  }
  finished_.clear();
}

void TaskOrchestrator::WaitIdle() {
  std::unique_lock lock(workers_mutex_);
  idle_cv_.wait(lock, [this] { return finished_.size() == workers_.size(); });
  Reap();
}

void TaskOrchestrator::Shutdown() {
  {
    std::lock_guard lock(workers_mutex_);
    shutting_down_ = true;
  }
  WaitIdle();
}

std::size_t TaskOrchestrator::ActiveRuns() const {
  std::lock_guard lock(workers_mutex_);
  return workers_.size() - finished_.size();
}

stage::StageResult TaskOrchestrator::RunStage(Stage stage, const stage::StageContext& context) {
  const auto& runner = runners_[model::StageIndex(stage)];
  if (!runner) {
    throw util::StageError(stage, "no runner configured");
  }

  try {
    return runner->Run(context);
  } catch (const util::StageError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StageError(stage, e.what());
  } catch (...) {
    throw util::StageError(stage, "unknown exception");
  }
}

model::Task TaskOrchestrator::Fail(const std::string& task_id, const util::StageError& error) {
  const auto stage = error.Stage();

  // the failed stage keeps the progress it had reached
  auto current = store_->Get(task_id);
  store_->UpdateStage(task_id, stage, StageStatus::kFailed, error.Cause(), current.stage_states[model::StageIndex(stage)].progress);

  auto finalized = store_->Finalize(task_id, model::TaskError{stage, error.what()});
  if (!finalized) {
    return store_->Get(task_id);
  }

  CODEREVIEW_LOG_WARN("task failed", {StringField("task_id", task_id), StringField("stage", model::StageName(stage)), StringField("error", error.Cause())});
  Publish(broker::FailedEvent(*finalized));
  return *finalized;
}

void TaskOrchestrator::Abort(const std::string& task_id, const std::string& cause) noexcept {
  CODEREVIEW_LOG_ERROR("task worker aborted", {StringField("task_id", task_id), StringField("error", cause)});
  try {
    // blame the stage that was running, or the first one if none had begun
    auto stage   = model::kStageSequence.front();
    auto current = store_->Get(task_id);
    for (const auto candidate : model::kStageSequence) {
      if (current.stage_states[model::StageIndex(candidate)].status == StageStatus::kRunning) {
        stage = candidate;
        break;
      }
    }
    Fail(task_id, util::StageError(stage, cause));
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_ERROR("failed to finalize aborted task", {StringField("task_id", task_id), StringField("error", e.what())});
  }
}

model::Task TaskOrchestrator::Execute(const model::Task& task) {
  observability::SpanScope span("task.run");
  span.SetAttribute("task_id", task.id);
  CODEREVIEW_LOG_INFO("task started", {StringField("task_id", task.id), StringField("file_name", task.file_name)});

  stage::StageContext context;
  context.task_id   = task.id;
  context.file_name = task.file_name;
  context.options   = task.options;

  std::string saved_path;

  for (const auto stage : model::kStageSequence) {
    if (auto snapshot = store_->UpdateStage(task.id, stage, StageStatus::kRunning, std::string(model::StageName(stage)) + " running", 0.0)) {
      Publish(broker::StageUpdateEvent(*snapshot, stage));
    }

    context.stage    = stage;
    const auto began = std::chrono::steady_clock::now();

    stage::StageResult result;
    try {
      if (stage == model::kStageSequence.front()) {
        try {
          context.original_content = sources_->Load(task.file_path);
        } catch (const std::exception& e) {
          throw util::StageError(stage, std::string("failed to load source: ") + e.what());
        } catch (...) {
          throw util::StageError(stage, "failed to load source: unknown exception");
        }
        context.current_content = context.original_content;
      }
      result = RunStage(stage, context);
    } catch (const util::StageError& e) {
      const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - began).count();
      observability::Metrics::Instance().ObserveStageDurationMs(model::StageName(stage), false, elapsed);
      span.RecordException(e.what());
      return Fail(task.id, e);
    }

    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - began).count();
    observability::Metrics::Instance().ObserveStageDurationMs(model::StageName(stage), true, elapsed);

    model::StageReport report;
    report.stage         = stage;
    report.report        = result.report;
    report.metrics       = result.metrics;
    report.artifact_path = result.artifact_path;
    context.prior_reports.push_back(std::move(report));

    if (!result.fixed_content.empty()) {
      context.current_content = result.fixed_content;
    }
    if (!result.artifact_path.empty()) {
      saved_path = result.artifact_path;
    }

    if (auto snapshot = store_->UpdateStage(task.id, stage, StageStatus::kCompleted, StageSummary(stage, result), 100.0)) {
      Publish(broker::StageUpdateEvent(*snapshot, stage));
    }
    CODEREVIEW_LOG_INFO("stage completed", {StringField("task_id", task.id), StringField("stage", model::StageName(stage)),
                                            observability::DoubleField("elapsed_ms", elapsed)});
  }

  model::TaskResult outcome;
  outcome.original_content = context.original_content;
  outcome.fixed_content    = context.current_content;
  outcome.reports          = std::move(context.prior_reports);
  outcome.diff             = SummarizeDiff(outcome.original_content, outcome.fixed_content);
  outcome.saved_file_path  = saved_path;

  auto finalized = store_->Finalize(task.id, std::move(outcome));
  if (!finalized) {
    return store_->Get(task.id);
  }

  CODEREVIEW_LOG_INFO("task completed",
                      {StringField("task_id", task.id), observability::IntField("lines_added", static_cast<int64_t>(finalized->result->diff.lines_added)),
                       observability::IntField("lines_removed", static_cast<int64_t>(finalized->result->diff.lines_removed))});
  Publish(broker::CompletedEvent(*finalized));
  return *finalized;
}

} // namespace codereview::core
