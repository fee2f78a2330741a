#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

namespace schemaver::db::postgres {

/*
  PgSession

  The single connection a migration run owns, plus the
  transaction currently open on it (if any).

  libpqxx connections are NOT thread-safe and a connection
  carries at most one transaction object at a time, so every
  statement is routed through the open pqxx::work when there is
  one and through a short-lived pqxx::nontransaction otherwise.

  Lifetime:
    PgDatabase and PgTransaction share ownership.
*/
struct PgSession {
  explicit PgSession(const std::string& conninfo) : conn(conninfo) {
  }

  pqxx::connection            conn;
  std::unique_ptr<pqxx::work> work;
};

} // namespace schemaver::db::postgres
