#include "sqlite_tx.hpp"

#include <spdlog/spdlog.h>

namespace schemaver::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    auto r = Rollback();
    if (!r) {
      spdlog::error("sqlite rollback on destruction failed: {}", r.message);
    }
  }
}

Result SqliteTransaction::Commit() {
  if (finished_) return Result::Err(ErrorCode::InvalidState, "transaction already finished");

  auto r = db_->Exec("COMMIT;");
  if (!r) {
    // a failed COMMIT leaves the transaction open; the caller rolls back
    return r;
  }
  finished_ = true;
  return r;
}

Result SqliteTransaction::Rollback() {
  if (finished_) return Result::Err(ErrorCode::InvalidState, "transaction already finished");

  finished_ = true;

  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (sqlite3_get_autocommit(db_->Handle())) return Result::Ok();
  return db_->Exec("ROLLBACK;");
}

} // namespace schemaver::db::sqlite
