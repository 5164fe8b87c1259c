#include "sqlite_task_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace codereview::db::sqlite {

using codereview::db::ErrorCode;
using codereview::db::Result;

namespace {

constexpr const char* kSelectColumns = "SELECT id, status, created_at_ms, updated_at_ms, json FROM review_task";

void BindText(sqlite3_stmt* st, int idx, const std::string& value) {
  sqlite3_bind_text(st, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t value) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(value));
}

std::string ColumnText(sqlite3_stmt* st, int col) {
  const auto* text = sqlite3_column_text(st, col);
  return text ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string();
}

model::TaskRecord ReadRow(sqlite3_stmt* st) {
  model::TaskRecord record;
  record.id            = ColumnText(st, 0);
  record.status        = sqlite3_column_int(st, 1);
  record.created_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st, 2));
  record.updated_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st, 3));
  record.json          = ColumnText(st, 4);
  return record;
}

} // namespace

SqliteTaskRepository::SqliteTaskRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteTaskRepository::Bootstrap() {
  std::lock_guard lock(writer_mutex_);
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS review_task ("
      "  id            TEXT PRIMARY KEY,"
      "  status        INTEGER NOT NULL,"
      "  created_at_ms INTEGER NOT NULL,"
      "  updated_at_ms INTEGER NOT NULL,"
      "  json          TEXT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS review_task_created_at ON review_task(created_at_ms, id);");
}

std::unique_ptr<db::Transaction> SqliteTaskRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, std::unique_lock<std::mutex>(writer_mutex_));
}

Result SqliteTaskRepository::Translate(sqlite3* db, int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return Result::Ok();
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteTaskRepository::UpsertTask(Transaction&, const model::TaskRecord& record) {
  if (record.id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "task id must not be empty");
  }

  // created_at_ms is immutable once the row exists
  auto st = db_->Prepare(
      "INSERT INTO review_task (id, status, created_at_ms, updated_at_ms, json) VALUES (?1, ?2, ?3, ?4, ?5) "
      "ON CONFLICT(id) DO UPDATE SET status = excluded.status, updated_at_ms = excluded.updated_at_ms, json = excluded.json;");
  BindText(st.get(), 1, record.id);
  sqlite3_bind_int(st.get(), 2, record.status);
  BindU64(st.get(), 3, record.created_at_ms);
  BindU64(st.get(), 4, record.updated_at_ms);
  BindText(st.get(), 5, record.json);

  return Translate(db_->Handle(), sqlite3_step(st.get()));
}

std::optional<model::TaskRecord> SqliteTaskRepository::GetTask(Transaction&, const std::string& id) {
  auto st = db_->Prepare((std::string(kSelectColumns) + " WHERE id = ?1;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return ReadRow(st.get());
}

std::vector<model::TaskRecord> SqliteTaskRepository::ListTasks(Transaction&) {
  auto st = db_->Prepare((std::string(kSelectColumns) + " ORDER BY created_at_ms ASC, id ASC;").c_str());

  std::vector<model::TaskRecord> records;
  int                            rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    records.push_back(ReadRow(st.get()));
  }
  if (rc != SQLITE_DONE) {
    const auto result = Translate(db_->Handle(), rc);
    throw std::runtime_error("listing tasks failed: " + result.message);
  }
  return records;
}

Result SqliteTaskRepository::DeleteTask(Transaction&, const std::string& id) {
  auto st = db_->Prepare("DELETE FROM review_task WHERE id = ?1;");
  BindText(st.get(), 1, id);
  return Translate(db_->Handle(), sqlite3_step(st.get()));
}

} // namespace codereview::db::sqlite
