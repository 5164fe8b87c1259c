#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/task_record.hpp"

namespace codereview::db {

/*
  Persistence collaborator for task records.

  The TaskStore keeps the authoritative in-memory copy and writes every
  mutation through this interface. Backends only need load/save semantics:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpsertTask replaces the whole row
*/
class TaskRepository {
 public:
  virtual ~TaskRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result UpsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Oldest first.
  virtual std::vector<model::TaskRecord> ListTasks(Transaction&) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& id) = 0;
};

} // namespace codereview::db
