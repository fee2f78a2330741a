#include "pg_tx.hpp"

#include <spdlog/spdlog.h>

#include "pg_database.hpp"

namespace schemaver::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgSession> session) : session_(std::move(session)) {
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    auto r = Rollback();
    if (!r) {
      spdlog::error("postgres rollback on destruction failed: {}", r.message);
    }
  }
}

Result PgTransaction::Commit() {
  if (finished_ || !session_->work) return Result::Err(ErrorCode::InvalidState, "transaction already finished");

  try {
    session_->work->commit();
  } catch (const std::exception& e) {
    // libpqxx leaves the work object unusable; only Rollback() remains
    return PgDatabase::Translate(e);
  }
  session_->work.reset();
  finished_ = true;
  return Result::Ok();
}

Result PgTransaction::Rollback() {
  if (finished_) return Result::Err(ErrorCode::InvalidState, "transaction already finished");

  finished_ = true;
  auto work = std::move(session_->work);
  if (!work) return Result::Ok();

  try {
    work->abort();
  } catch (const std::exception& e) {
    return PgDatabase::Translate(e);
  }
  return Result::Ok();
}

} // namespace schemaver::db::postgres
