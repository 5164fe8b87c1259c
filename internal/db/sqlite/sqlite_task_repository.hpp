#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/task_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace codereview::db::sqlite {

/*
  Task rows in a single `review_task` table.

  One connection, one writer at a time: Begin() holds writer_mutex_ for the
  lifetime of the returned transaction, so callers must not open a second
  transaction on the same thread while one is alive.
*/
class SqliteTaskRepository final : public db::TaskRepository {
public:
  explicit SqliteTaskRepository(std::shared_ptr<SqliteDB> db);

  // Creates the table and its index when missing.
  void Bootstrap();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;

  // Throws when the scan fails part way.
  std::vector<model::TaskRecord> ListTasks(Transaction&) override;
  Result DeleteTask(Transaction&, const std::string&) override;

private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
  std::mutex writer_mutex_;
};

}
