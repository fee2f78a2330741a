#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace schemaver::testing {

/*
  Scripted in-memory capability for engine tests.

  Understands only the bookkeeping statements the engine issues;
  every other statement is recorded verbatim in `applied`. Writes
  made inside a transaction are discarded by Rollback().

  `calls` logs every capability call in order:
    list_tables, query, exec:<sql>, begin, commit, rollback
*/
class FakeDatabase final : public db::Database {
 public:
  struct State {
    bool                       has_meta = false;
    std::optional<std::string> version_value;
    std::vector<std::string>   applied;
  };

  State                    committed;
  std::vector<std::string> calls;

  std::set<std::string> reject_statements;
  bool                  fail_begin         = false;
  bool                  fail_commit        = false;
  bool                  fail_list_tables   = false;
  bool                  fail_version_write = false;

  int MutatingCalls() const {
    int n = 0;
    for (const auto& call : calls) {
      if (call.rfind("exec:", 0) == 0 || call == "begin" || call == "commit") ++n;
    }
    return n;
  }

  std::optional<int> RecordedVersion() const {
    if (!committed.has_meta || !committed.version_value) return std::nullopt;
    return std::stoi(*committed.version_value);
  }

  db::Result ListTables(const std::string& name_filter, std::vector<std::string>* tables) override {
    calls.push_back("list_tables");
    tables->clear();
    if (fail_list_tables) return db::Result::Err(db::ErrorCode::IOError, "disk I/O error");
    if (View().has_meta && (name_filter == "meta" || name_filter == "%")) tables->push_back("meta");
    return db::Result::Ok();
  }

  db::Result QueryScalar(const std::string& sql, std::optional<std::string>* value) override {
    calls.push_back("query");
    value->reset();
    if (sql != db::sql::SELECT_SCHEMA_VERSION) {
      return db::Result::Err(db::ErrorCode::InternalError, "unexpected query: " + sql);
    }
    if (!View().has_meta) return db::Result::Err(db::ErrorCode::InternalError, "no such table: meta");
    *value = View().version_value;
    return db::Result::Ok();
  }

  db::Result Execute(const std::string& sql) override {
    calls.push_back("exec:" + sql);
    if (reject_statements.count(sql)) {
      return db::Result::Err(db::ErrorCode::InternalError, "near \"" + sql + "\": syntax error");
    }

    State& s = Mutable();
    if (sql == db::sql::CREATE_BOOKKEEPING_TABLE) {
      if (s.has_meta) return db::Result::Err(db::ErrorCode::AlreadyExists, "table meta already exists");
      s.has_meta = true;
      return db::Result::Ok();
    }
    if (sql == db::sql::INSERT_SCHEMA_VERSION) {
      if (!s.has_meta) return db::Result::Err(db::ErrorCode::InternalError, "no such table: meta");
      s.version_value = "0";
      return db::Result::Ok();
    }
    if (sql.rfind("UPDATE meta SET value='", 0) == 0) {
      if (fail_version_write) return db::Result::Err(db::ErrorCode::Busy, "database is locked");
      if (!s.has_meta) return db::Result::Err(db::ErrorCode::InternalError, "no such table: meta");
      auto begin      = sql.find('\'') + 1;
      auto end        = sql.find('\'', begin);
      s.version_value = sql.substr(begin, end - begin);
      return db::Result::Ok();
    }

    s.applied.push_back(sql);
    return db::Result::Ok();
  }

  db::Result BeginTransaction(std::unique_ptr<db::Transaction>* tx) override;

  const char* BackendName() const override {
    return "fake";
  }

 private:
  friend class FakeTransaction;

  const State& View() const {
    return working_ ? *working_ : committed;
  }

  State& Mutable() {
    return working_ ? *working_ : committed;
  }

  std::optional<State> working_;
};

class FakeTransaction final : public db::Transaction {
 public:
  explicit FakeTransaction(FakeDatabase& db) : db_(db) {
  }

  ~FakeTransaction() override {
    if (!finished_) (void)Rollback();
  }

  db::Result Commit() override {
    db_.calls.push_back("commit");
    if (db_.fail_commit) return db::Result::Err(db::ErrorCode::IOError, "commit refused");
    db_.committed = std::move(*db_.working_);
    db_.working_.reset();
    finished_ = true;
    return db::Result::Ok();
  }

  db::Result Rollback() override {
    db_.calls.push_back("rollback");
    db_.working_.reset();
    finished_ = true;
    return db::Result::Ok();
  }

  bool IsFinished() const override {
    return finished_;
  }

 private:
  FakeDatabase& db_;
  bool          finished_ = false;
};

inline db::Result FakeDatabase::BeginTransaction(std::unique_ptr<db::Transaction>* tx) {
  calls.push_back("begin");
  if (fail_begin) return db::Result::Err(db::ErrorCode::Busy, "database is locked");
  if (working_) return db::Result::Err(db::ErrorCode::InvalidState, "a transaction is already open");
  working_ = committed;
  *tx      = std::make_unique<FakeTransaction>(*this);
  return db::Result::Ok();
}

} // namespace schemaver::testing
