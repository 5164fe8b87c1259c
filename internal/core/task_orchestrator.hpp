#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/broker/progress_broker.hpp"
#include "internal/core/task_store.hpp"
#include "internal/stage/stage_runner.hpp"
#include "internal/storage/source_store.hpp"
#include "internal/util/errors.hpp"

namespace codereview::core {

/*
  Drives a task through Architect -> Reviewer -> Optimizer -> Save.

  The orchestrator is the only writer of task status transitions. After
  every store mutation it broadcasts an event built from the snapshot the
  store returned, so subscribers observe stage updates in stage order and
  exactly one terminal event per task.

  Stage failures never escape: they become the task's Failed state. Only
  the preconditions (unknown id, task not Pending) throw.
*/
class TaskOrchestrator {
 public:
  TaskOrchestrator(std::shared_ptr<TaskStore> store, std::shared_ptr<broker::ProgressBroker> broker, storage::SourceStorePtr sources,
                   stage::StageRunners runners);
  ~TaskOrchestrator();

  TaskOrchestrator(const TaskOrchestrator&)            = delete;
  TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

  // Runs the whole pipeline in the calling thread and returns the terminal
  // snapshot. Throws util::TaskNotFound or util::InvalidState.
  model::Task Run(const std::string& task_id);

  // Marks the task Running in the calling thread, then runs the pipeline on
  // a dedicated worker thread. Returns the Running snapshot.
  model::Task Start(const std::string& task_id);

  // Blocks until no worker thread is running.
  void WaitIdle();

  // Rejects further Start calls and joins every worker.
  void Shutdown();

  std::size_t ActiveRuns() const;

 private:
  model::Task Execute(const model::Task& task);

  stage::StageResult RunStage(model::Stage stage, const stage::StageContext& context);

  // Records the stage failure and broadcasts the terminal event. The task
  // error message carries the stage name; the stage state keeps the cause.
  model::Task Fail(const std::string& task_id, const util::StageError& error);

  // Last resort for a worker whose pipeline threw outside a stage.
  void Abort(const std::string& task_id, const std::string& cause) noexcept;

  void Publish(const broker::ProgressEvent& event);

  // Joins workers that already finished.
  void Reap();

  std::shared_ptr<TaskStore>              store_;
  std::shared_ptr<broker::ProgressBroker> broker_;
  storage::SourceStorePtr                 sources_;
  stage::StageRunners                     runners_;

  mutable std::mutex                           workers_mutex_;
  std::condition_variable                      idle_cv_;
  std::unordered_map<std::string, std::thread> workers_;
  std::vector<std::string>                     finished_;
  bool                                         shutting_down_ = false;
};

} // namespace codereview::core
