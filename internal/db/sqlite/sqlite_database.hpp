#pragma once

#include <memory>

#include "internal/db/api/database.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace schemaver::db::sqlite {

class SqliteDatabase final : public db::Database {
 public:
  explicit SqliteDatabase(std::shared_ptr<SqliteDB> db);

  Result ListTables(const std::string& name_filter, std::vector<std::string>* tables) override;
  Result QueryScalar(const std::string& sql, std::optional<std::string>* value) override;
  Result Execute(const std::string& sql) override;
  Result BeginTransaction(std::unique_ptr<Transaction>* tx) override;

  const char* BackendName() const override {
    return "sqlite";
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace schemaver::db::sqlite
