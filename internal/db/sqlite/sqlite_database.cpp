#include "sqlite_database.hpp"

#include <sqlite3.h>

namespace schemaver::db::sqlite {

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteDatabase::SqliteDatabase(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteDatabase::ListTables(const std::string& name_filter, std::vector<std::string>* tables) {
  tables->clear();

  const char* sql =
      "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' AND name LIKE ? "
      "ORDER BY name;";

  sqlite3_stmt* st = nullptr;
  if (auto r = db_->Prepare(sql, &st); !r) return r;

  sqlite3_bind_text(st, 1, name_filter.c_str(), -1, SQLITE_TRANSIENT);

  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    tables->push_back(ColText(st, 0));
  }
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    tables->clear();
    return SqliteDB::Translate(rc, sqlite3_errmsg(db_->Handle()));
  }
  return Result::Ok();
}

Result SqliteDatabase::QueryScalar(const std::string& sql, std::optional<std::string>* value) {
  value->reset();

  sqlite3_stmt* st = nullptr;
  if (auto r = db_->Prepare(sql, &st); !r) return r;
  if (!st) {
    return Result::Err(ErrorCode::InvalidState, "empty query");
  }

  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW && sqlite3_column_count(st) > 0 && sqlite3_column_type(st, 0) != SQLITE_NULL) {
    *value = ColText(st, 0);
  }
  auto r = SqliteDB::Translate(rc, sqlite3_errmsg(db_->Handle()));
  sqlite3_finalize(st);
  return r;
}

Result SqliteDatabase::Execute(const std::string& sql) {
  return db_->Exec(sql);
}

Result SqliteDatabase::BeginTransaction(std::unique_ptr<Transaction>* tx) {
  if (!sqlite3_get_autocommit(db_->Handle())) {
    return Result::Err(ErrorCode::InvalidState, "a transaction is already open");
  }

  if (auto r = db_->Exec("BEGIN IMMEDIATE;"); !r) return r;

  *tx = std::make_unique<SqliteTransaction>(db_);
  return Result::Ok();
}

} // namespace schemaver::db::sqlite
