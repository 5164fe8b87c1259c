#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/task_repository.hpp"
#include "internal/model/task.hpp"

namespace codereview::core {

/*
  Authoritative, thread-safe registry of review tasks.

  Every state transition of a task goes through here. Mutations are
  serialized per task (one mutex per record); the store-wide shared_mutex
  only guards the map itself, so a slow write on one task never blocks
  another.

  Every mutation is written through to the repository while the record
  lock is held, so the persisted order matches the in-memory order. A
  failed write is logged and counted; memory stays authoritative.

  Mutating calls return the post-mutation snapshot, or nullopt when the
  call was a no-op (terminal task, backward transition, second finalize).
*/
class TaskStore {
 public:
  explicit TaskStore(std::shared_ptr<codereview::db::TaskRepository> repository);

  // Throws util::InvalidArgument when file_name is empty.
  model::Task Create(std::string file_name, std::string file_path, uint64_t file_size, std::map<std::string, std::string> options = {});

  // Throws util::TaskNotFound.
  model::Task Get(const std::string& task_id) const;

  bool Contains(const std::string& task_id) const;

  // Throws util::TaskNotFound. No-op on a terminal task or when the stage
  // status would move backwards.
  std::optional<model::Task> UpdateStage(const std::string& task_id, model::Stage stage, model::StageStatus status, const std::string& message,
                                         double progress);

  // Pending -> Running exactly once. Throws util::TaskNotFound or
  // util::InvalidState.
  model::Task BeginRun(const std::string& task_id);

  // First terminal write wins; later calls return nullopt.
  std::optional<model::Task> Finalize(const std::string& task_id, model::TaskResult result);
  std::optional<model::Task> Finalize(const std::string& task_id, model::TaskError error);

  // Newest first. limit == 0 returns everything after offset.
  std::vector<model::Task> List(std::size_t offset = 0, std::size_t limit = 0) const;

  std::size_t Count() const;

  // Drops the oldest terminal tasks until at most max_tasks remain (or no
  // terminal task is left). max_tasks == 0 disables retention.
  std::size_t EnforceRetention(std::size_t max_tasks);

  // Loads persisted tasks. Tasks that were not terminal when the previous
  // process stopped are finalized as Failed. Returns the number loaded.
  std::size_t Hydrate();

 private:
  struct Entry {
    mutable std::mutex mutex;
    model::Task        task;
  };

  std::shared_ptr<Entry> Find(const std::string& task_id) const;

  void Persist(const model::Task& task);
  void Erase(const std::string& task_id);

  std::shared_ptr<codereview::db::TaskRepository> repository_;

  mutable std::shared_mutex                               tasks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> tasks_;
};

} // namespace codereview::core
