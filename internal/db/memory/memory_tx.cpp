#include "memory_tx.hpp"

#include <stdexcept>

namespace codereview::db::memory {

MemoryTransaction::MemoryTransaction(MemoryTaskRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("transaction already rolled back");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (auto& [id, record] : writes_) {
    if (record.has_value()) {
      repo_.committed_[id] = std::move(*record);
    } else {
      repo_.committed_.erase(id);
    }
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace codereview::db::memory
