#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace codereview::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Owns the single connection the task repository writes through.

  Opened FULLMUTEX; writers are additionally serialized by the
  repository so a transaction never interleaves with another.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results. Throws on error.
  void Exec(const std::string& sql);

  // Throws on a malformed statement.
  Statement Prepare(const char* sql);

  int Changes() const {
    return sqlite3_changes(db_);
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace codereview::db::sqlite
