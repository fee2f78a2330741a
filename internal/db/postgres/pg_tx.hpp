#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "pg_session.hpp"

namespace schemaver::db::postgres {

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgSession> session);
  ~PgTransaction() override;

  Result Commit() override;
  Result Rollback() override;
  bool   IsFinished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<PgSession> session_;
  bool                       finished_ = false;
};

} // namespace schemaver::db::postgres
