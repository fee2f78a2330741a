#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"

namespace schemaver::db {

/*
  Database capability.

  The only surface the migration engine talks to. Statements are
  opaque strings; the capability never parses them.

  CRITICAL GUARANTEES:

  - Every operation reports failure through its Result, never
    by throwing and never by a silently ignored flag
  - Only one transaction may be open at a time
  - Operations are issued one at a time, in program order
*/

class Database {
 public:
  virtual ~Database() = default;

  // Names of tables in the current schema matching a SQL LIKE pattern.
  virtual Result ListTables(const std::string& name_filter, std::vector<std::string>* tables) = 0;

  // First column of the first row. Empty when there is no row or the value is NULL.
  virtual Result QueryScalar(const std::string& sql, std::optional<std::string>* value) = 0;

  virtual Result Execute(const std::string& sql) = 0;

  virtual Result BeginTransaction(std::unique_ptr<Transaction>* tx) = 0;

  // Short backend name for diagnostics ("sqlite", "postgres").
  virtual const char* BackendName() const = 0;
};

} // namespace schemaver::db
