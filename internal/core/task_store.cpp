#include "task_store.hpp"

#include <algorithm>
#include <exception>

#include "internal/db/codec/task_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace codereview::core {

using codereview::observability::StringField;
using model::Stage;
using model::StageStatus;
using model::TaskStatus;

namespace {

constexpr const char* kInterruptedMessage = "interrupted by restart";

bool NewerFirst(const model::Task& a, const model::Task& b) {
  if (a.created_at != b.created_at) {
    return a.created_at > b.created_at;
  }
  return a.id > b.id;
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<codereview::db::TaskRepository> repository) : repository_(std::move(repository)) {
}

std::shared_ptr<TaskStore::Entry> TaskStore::Find(const std::string& task_id) const {
  std::shared_lock lock(tasks_mutex_);
  auto             it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    throw util::TaskNotFound("task not found: " + task_id);
  }
  return it->second;
}

void TaskStore::Persist(const model::Task& task) {
  if (!repository_) {
    return;
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->UpsertTask(*tx, codereview::db::codec::EncodeTask(task));
    if (!result) {
      CODEREVIEW_LOG_WARN("task write-through failed", {StringField("task_id", task.id), StringField("code", codereview::db::ErrorCodeName(result.code)),
                                                      StringField("error", result.message)});
      observability::Metrics::Instance().RecordPersistenceFailure("upsert");
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_WARN("task write-through failed", {StringField("task_id", task.id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordPersistenceFailure("upsert");
  }
}

void TaskStore::Erase(const std::string& task_id) {
  if (!repository_) {
    return;
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteTask(*tx, task_id);
    if (!result) {
      CODEREVIEW_LOG_WARN("task delete failed", {StringField("task_id", task_id), StringField("code", codereview::db::ErrorCodeName(result.code)),
                                              StringField("error", result.message)});
      observability::Metrics::Instance().RecordPersistenceFailure("delete");
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_WARN("task delete failed", {StringField("task_id", task_id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordPersistenceFailure("delete");
  }
}

model::Task TaskStore::Create(std::string file_name, std::string file_path, uint64_t file_size, std::map<std::string, std::string> options) {
  if (file_name.empty()) {
    throw util::InvalidArgument("file_name is required");
  }

  auto entry  = std::make_shared<Entry>();
  entry->task = model::NewTask(util::GenerateId(), std::move(file_name), std::move(file_path), file_size, std::move(options), util::Now());

  // lock the record before publishing it so the first persisted version
  // is the creation one
  std::lock_guard record_lock(entry->mutex);
  {
    std::unique_lock lock(tasks_mutex_);
    if (!tasks_.emplace(entry->task.id, entry).second) {
      throw util::InvalidState("duplicate task id: " + entry->task.id);
    }
  }

  Persist(entry->task);
  CODEREVIEW_LOG_INFO("task created", {StringField("task_id", entry->task.id), StringField("file_name", entry->task.file_name)});
  return entry->task;
}

model::Task TaskStore::Get(const std::string& task_id) const {
  auto            entry = Find(task_id);
  std::lock_guard lock(entry->mutex);
  return entry->task;
}

bool TaskStore::Contains(const std::string& task_id) const {
  std::shared_lock lock(tasks_mutex_);
  return tasks_.contains(task_id);
}

std::optional<model::Task> TaskStore::UpdateStage(const std::string& task_id, Stage stage, StageStatus status, const std::string& message,
                                                  double progress) {
  auto            entry = Find(task_id);
  std::lock_guard lock(entry->mutex);
  auto&           task = entry->task;

  if (model::IsTerminal(task.status)) {
    return std::nullopt;
  }

  auto& state = task.stage_states[model::StageIndex(stage)];
  if (!model::CanTransition(state.status, status)) {
    return std::nullopt;
  }

  const auto now   = util::Now();
  state.status     = status;
  state.message    = message;
  state.progress   = std::clamp(progress, 0.0, 100.0);
  state.updated_at = now;

  task.stage_cursor     = std::max<uint32_t>(task.stage_cursor, static_cast<uint32_t>(model::StageIndex(stage)));
  task.overall_progress = model::OverallProgress(task.stage_states);
  task.updated_at       = now;

  Persist(task);
  return task;
}

model::Task TaskStore::BeginRun(const std::string& task_id) {
  auto            entry = Find(task_id);
  std::lock_guard lock(entry->mutex);
  auto&           task = entry->task;

  if (!model::CanTransition(task.status, TaskStatus::kRunning)) {
    throw util::InvalidState("task " + task_id + " is " + std::string(model::TaskStatusName(task.status)));
  }

  const auto now  = util::Now();
  task.status     = TaskStatus::kRunning;
  task.started_at = now;
  task.updated_at = now;

  Persist(task);
  return task;
}

std::optional<model::Task> TaskStore::Finalize(const std::string& task_id, model::TaskResult result) {
  auto            entry = Find(task_id);
  std::lock_guard lock(entry->mutex);
  auto&           task = entry->task;

  if (model::IsTerminal(task.status)) {
    return std::nullopt;
  }
  if (!model::CanTransition(task.status, TaskStatus::kCompleted)) {
    throw util::InvalidState("task " + task_id + " cannot complete from " + std::string(model::TaskStatusName(task.status)));
  }

  const auto now        = util::Now();
  task.status           = TaskStatus::kCompleted;
  task.result           = std::move(result);
  task.overall_progress = model::OverallProgress(task.stage_states);
  task.updated_at       = now;
  task.completed_at     = now;

  Persist(task);
  return task;
}

std::optional<model::Task> TaskStore::Finalize(const std::string& task_id, model::TaskError error) {
  auto            entry = Find(task_id);
  std::lock_guard lock(entry->mutex);
  auto&           task = entry->task;

  if (model::IsTerminal(task.status)) {
    return std::nullopt;
  }

  const auto now        = util::Now();
  task.status           = TaskStatus::kFailed;
  task.error            = std::move(error);
  task.overall_progress = model::OverallProgress(task.stage_states);
  task.updated_at       = now;
  task.completed_at     = now;

  Persist(task);
  return task;
}

std::vector<model::Task> TaskStore::List(std::size_t offset, std::size_t limit) const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(tasks_mutex_);
    entries.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) {
      entries.push_back(entry);
    }
  }

  std::vector<model::Task> tasks;
  tasks.reserve(entries.size());
  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mutex);
    tasks.push_back(entry->task);
  }
  std::sort(tasks.begin(), tasks.end(), NewerFirst);

  if (offset >= tasks.size()) {
    return {};
  }
  auto first = tasks.begin() + static_cast<std::ptrdiff_t>(offset);
  auto last  = limit == 0 || limit >= tasks.size() - offset ? tasks.end() : first + static_cast<std::ptrdiff_t>(limit);
  return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

std::size_t TaskStore::Count() const {
  std::shared_lock lock(tasks_mutex_);
  return tasks_.size();
}

std::size_t TaskStore::EnforceRetention(std::size_t max_tasks) {
  if (max_tasks == 0) {
    return 0;
  }

  auto snapshot = List();
  if (snapshot.size() <= max_tasks) {
    return 0;
  }

  // List() is newest first; walk from the oldest end
  std::size_t excess  = snapshot.size() - max_tasks;
  std::size_t evicted = 0;
  for (auto it = snapshot.rbegin(); it != snapshot.rend() && evicted < excess; ++it) {
    if (!model::IsTerminal(it->status)) {
      continue;
    }
    {
      std::unique_lock lock(tasks_mutex_);
      if (tasks_.erase(it->id) == 0) {
        continue;
      }
    }
    Erase(it->id);
    ++evicted;
  }

  if (evicted > 0) {
    CODEREVIEW_LOG_INFO("task retention applied",
                        {observability::IntField("evicted", static_cast<int64_t>(evicted)), observability::IntField("max_tasks", static_cast<int64_t>(max_tasks))});
  }
  return evicted;
}

std::size_t TaskStore::Hydrate() {
  if (!repository_) {
    return 0;
  }

  std::vector<codereview::db::model::TaskRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ListTasks(*tx);
    tx->Commit();
  }

  std::size_t loaded      = 0;
  std::size_t interrupted = 0;
  for (const auto& record : records) {
    model::Task task;
    try {
      task = codereview::db::codec::DecodeTask(record);
    } catch (const util::InvalidArgument& e) {
      CODEREVIEW_LOG_WARN("skipping unreadable task record", {StringField("task_id", record.id), StringField("error", e.what())});
      continue;
    }

    if (!model::IsTerminal(task.status)) {
      const auto now = util::Now();
      auto&      state = task.stage_states[task.stage_cursor < model::kStageCount ? task.stage_cursor : model::kStageCount - 1];
      if (!model::IsTerminal(state.status)) {
        state.status     = StageStatus::kFailed;
        state.message    = kInterruptedMessage;
        state.updated_at = now;
      }
      task.status           = TaskStatus::kFailed;
      task.error            = model::TaskError{state.stage, kInterruptedMessage};
      task.overall_progress = model::OverallProgress(task.stage_states);
      task.updated_at       = now;
      task.completed_at     = now;
      Persist(task);
      ++interrupted;
    }

    auto entry  = std::make_shared<Entry>();
    entry->task = std::move(task);

    std::unique_lock lock(tasks_mutex_);
    if (tasks_.emplace(entry->task.id, entry).second) {
      ++loaded;
    }
  }

  CODEREVIEW_LOG_INFO("tasks hydrated", {observability::IntField("loaded", static_cast<int64_t>(loaded)),
                                         observability::IntField("interrupted", static_cast<int64_t>(interrupted))});
  return loaded;
}

} // namespace codereview::core
