#pragma once

#include "internal/db/api/result.hpp"

namespace schemaver::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Statements executed through the owning Database while the
    transaction is open belong to it
  - Commit() makes them durable atomically
  - Rollback() discards them (DDL included where the engine supports it)
  - Destructor MUST rollback if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual Result Commit() = 0;

  // explicit rollback
  virtual Result Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace schemaver::db
