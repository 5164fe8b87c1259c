#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/task_repository.hpp"

namespace codereview::db::memory {

class MemoryTransaction;

class MemoryTaskRepository final : public db::TaskRepository {
public:
  MemoryTaskRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&) override;
  Result DeleteTask(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  std::unordered_map<std::string, model::TaskRecord> committed_;
};

}
