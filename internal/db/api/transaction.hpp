#pragma once

namespace codereview::db {

/*
  Unit of work against a TaskRepository.

  The TaskStore opens one per mutation and commits after the upsert or
  delete succeeded. Reads through the same transaction see its own writes;
  other transactions see them only after Commit(). Destroying an
  uncommitted transaction discards its writes.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
  virtual bool IsCommitted() const = 0;
};

}
