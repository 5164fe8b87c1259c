#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace codereview::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::unique_lock<std::mutex> writer)
    : db_(std::move(db)), writer_(std::move(writer)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_WARN("sqlite rollback failed", {codereview::observability::StringField("db", db_->Path()),
                                                   codereview::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error(committed_ ? "transaction already committed" : "transaction already rolled back");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace codereview::db::sqlite
