#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/api/result.hpp"

namespace schemaver::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode        = false;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Construction opens (or creates) the file and applies PRAGMAs;
  it throws std::runtime_error when the database cannot be opened.
  Everything after construction reports through db::Result.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Execute a SQL string; may contain several statements
  Result Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  Result Prepare(const std::string& sql, sqlite3_stmt** stmt);

  // Map a sqlite result code to a portable Result
  static Result Translate(int rc, const std::string& message);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace schemaver::db::sqlite
