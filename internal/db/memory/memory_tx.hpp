#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_task_repository.hpp"

namespace codereview::db::memory {

/*
  Transaction = committed view + write set

  A std::nullopt entry in the write set is a pending delete.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using WriteSet = std::unordered_map<std::string, std::optional<model::TaskRecord>>;

  explicit MemoryTransaction(MemoryTaskRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  WriteSet& Writes() {
    return writes_;
  }

  MemoryTaskRepository& Repo() {
    return repo_;
  }

 private:
  MemoryTaskRepository& repo_;
  WriteSet              writes_;
  bool                  committed_   = false;
  bool                  rolled_back_ = false;
};

} // namespace codereview::db::memory
