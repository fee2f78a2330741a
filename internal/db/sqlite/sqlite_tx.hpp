#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace schemaver::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock before the first DDL statement
    - a second writer fails fast with SQLITE_BUSY instead of
      deadlocking halfway through a step

  Created only through SqliteDatabase::BeginTransaction.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  Result Commit() override;
  Result Rollback() override;
  bool   IsFinished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace schemaver::db::sqlite
