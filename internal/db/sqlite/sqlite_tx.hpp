#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace codereview::db::sqlite {

/*
  BEGIN IMMEDIATE on construction, so the write lock is taken before the
  first upsert instead of being upgraded half way.

  Owns the repository's writer lock until the transaction object dies;
  an unfinished transaction is rolled back then.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::unique_lock<std::mutex> writer);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> writer_;
  bool committed_ = false;
  bool finished_ = false;
};

}
