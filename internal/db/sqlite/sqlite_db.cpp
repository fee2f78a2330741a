#include "sqlite_db.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace schemaver::db::sqlite {

static void ThrowIf(const Result& r, const char* what) {
  if (!r) {
    throw std::runtime_error(std::string(what) + ": " + r.message);
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite database '" + options_.path + "': " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

Result SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    return Translate(rc, msg);
  }
  return Result::Ok();
}

Result SqliteDB::Prepare(const std::string& sql, sqlite3_stmt** stmt) {
  *stmt  = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr);
  if (rc != SQLITE_OK) {
    return Translate(rc, sqlite3_errmsg(db_));
  }
  return Result::Ok();
}

Result SqliteDB::Translate(int rc, const std::string& message) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, message);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    case SQLITE_MISUSE:
      return Result::Err(ErrorCode::InvalidState, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

void SqliteDB::Configure() {
  if (options_.wal_mode) {
    // WAL lets readers proceed while a migration holds the write lock
    ThrowIf(Exec("PRAGMA journal_mode=WAL;"), "journal_mode");
    ThrowIf(Exec("PRAGMA synchronous=NORMAL;"), "synchronous");
  }

  // foreign keys are OFF by default in sqlite
  ThrowIf(Exec("PRAGMA foreign_keys=ON;"), "foreign_keys");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, options_.busy_timeout_ms);
  ThrowIf(Translate(rc, sqlite3_errmsg(db_)), "busy_timeout");
}

} // namespace schemaver::db::sqlite
