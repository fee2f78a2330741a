#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/database.hpp"
#include "pg_session.hpp"
#include "pg_tx.hpp"

namespace schemaver::db::postgres {

/*
  PostgreSQL capability.

  Postgres runs DDL transactionally, so a failed step leaves no
  trace of its statements.

  Construction connects and throws on failure (pqxx::broken_connection).
*/
class PgDatabase final : public db::Database {
 public:
  explicit PgDatabase(const std::string& conninfo);

  Result ListTables(const std::string& name_filter, std::vector<std::string>* tables) override;
  Result QueryScalar(const std::string& sql, std::optional<std::string>* value) override;
  Result Execute(const std::string& sql) override;
  Result BeginTransaction(std::unique_ptr<Transaction>* tx) override;

  const char* BackendName() const override {
    return "postgres";
  }

  static Result Translate(const std::exception& e);

 private:
  // Run fn inside the open transaction, or a nontransaction when none is open.
  Result Run(const std::function<void(pqxx::transaction_base&)>& fn);

  std::shared_ptr<PgSession> session_;
};

} // namespace schemaver::db::postgres
