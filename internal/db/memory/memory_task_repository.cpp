#include "memory_task_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace codereview::db::memory {

MemoryTaskRepository::MemoryTaskRepository() = default;

std::unique_ptr<db::Transaction> MemoryTaskRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryTaskRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "task id must not be empty");
  TX(t).Writes()[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryTaskRepository::GetTask(Transaction& t, const std::string& id) {
  auto& writes = TX(t).Writes();
  if (auto it = writes.find(id); it != writes.end()) {
    return it->second;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.find(id);
  if (it == committed_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryTaskRepository::ListTasks(Transaction& t) {
  std::unordered_map<std::string, model::TaskRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_;
  }
  for (const auto& [id, record] : TX(t).Writes()) {
    if (record.has_value()) {
      merged[id] = *record;
    } else {
      merged.erase(id);
    }
  }

  std::vector<model::TaskRecord> records;
  records.reserve(merged.size());
  for (auto& [_, record] : merged) {
    records.push_back(std::move(record));
  }
  std::sort(records.begin(), records.end(), [](const model::TaskRecord& a, const model::TaskRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryTaskRepository::DeleteTask(Transaction& t, const std::string& id) {
  TX(t).Writes()[id] = std::nullopt;
  return Result::Ok();
}

} // namespace codereview::db::memory
