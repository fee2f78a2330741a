#include "pg_database.hpp"

namespace schemaver::db::postgres {

PgDatabase::PgDatabase(const std::string& conninfo) : session_(std::make_shared<PgSession>(conninfo)) {
}

Result PgDatabase::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::syntax_error*>(&e)) {
    return Result::Err(ErrorCode::SyntaxError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::usage_error*>(&e)) {
    return Result::Err(ErrorCode::InvalidState, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgDatabase::Run(const std::function<void(pqxx::transaction_base&)>& fn) {
  try {
    if (session_->work) {
      fn(*session_->work);
      return Result::Ok();
    }

    pqxx::nontransaction ntx(session_->conn);
    fn(ntx);
    ntx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDatabase::ListTables(const std::string& name_filter, std::vector<std::string>* tables) {
  tables->clear();

  std::vector<std::string> found;
  auto r = Run([&](pqxx::transaction_base& tx) {
    auto res = tx.exec(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' AND table_name LIKE " +
        tx.quote(name_filter) + " ORDER BY table_name");
    for (const auto& row : res) {
      found.emplace_back(row[0].c_str());
    }
  });

  if (r) *tables = std::move(found);
  return r;
}

Result PgDatabase::QueryScalar(const std::string& sql, std::optional<std::string>* value) {
  value->reset();

  std::optional<std::string> found;
  auto r = Run([&](pqxx::transaction_base& tx) {
    auto res = tx.exec(sql);
    if (!res.empty() && res.columns() > 0 && !res[0][0].is_null()) {
      found = res[0][0].c_str();
    }
  });

  if (r) *value = std::move(found);
  return r;
}

Result PgDatabase::Execute(const std::string& sql) {
  return Run([&](pqxx::transaction_base& tx) { tx.exec(sql); });
}

Result PgDatabase::BeginTransaction(std::unique_ptr<Transaction>* tx) {
  if (session_->work) {
    return Result::Err(ErrorCode::InvalidState, "a transaction is already open");
  }

  try {
    session_->work = std::make_unique<pqxx::work>(session_->conn);
  } catch (const std::exception& e) {
    return Translate(e);
  }

  *tx = std::make_unique<PgTransaction>(session_);
  return Result::Ok();
}

} // namespace schemaver::db::postgres
