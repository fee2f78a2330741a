#include "internal/schema/step_executor.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace schemaver::schema {

using db::Result;
using observability::IntField;
using observability::StringField;

namespace {

Result Abort(db::Transaction& tx, const MigrationStep& step, const Result& cause, DiagnosticSink& sink) {
  std::string message = "step to version " + std::to_string(step.target_version) + " failed: " + cause.message;

  auto rollback = tx.Rollback();
  if (!rollback) {
    sink.Error("rollback failed", {IntField("to", step.target_version), StringField("error", rollback.message)});
    message += " (rollback failed: " + rollback.message + ")";
  }
  return Result::Err(cause.code, std::move(message));
}

} // namespace

Result ApplyStep(db::Database& database, const MigrationStep& step, DiagnosticSink& sink) {
  std::unique_ptr<db::Transaction> tx;
  if (auto r = database.BeginTransaction(&tx); !r) {
    return Result::Err(r.code, "step to version " + std::to_string(step.target_version) +
                                   " failed: cannot begin transaction: " + r.message);
  }

  if (step.create_bookkeeping_table) {
    sink.Debug("creating bookkeeping table", {StringField("table", db::sql::BOOKKEEPING_TABLE)});
    if (auto r = database.Execute(db::sql::CREATE_BOOKKEEPING_TABLE); !r) {
      return Abort(*tx, step, r, sink);
    }
    if (auto r = database.Execute(db::sql::INSERT_SCHEMA_VERSION); !r) {
      return Abort(*tx, step, r, sink);
    }
  }

  std::size_t index = 0;
  for (const auto& sql : step.statements) {
    ++index;
    sink.Debug("executing statement", {IntField("to", step.target_version), IntField("index", static_cast<std::int64_t>(index))});
    if (auto r = database.Execute(sql); !r) {
      sink.Warn("statement rejected", {IntField("to", step.target_version), IntField("index", static_cast<std::int64_t>(index)),
                                       StringField("error", r.message)});
      return Abort(*tx, step, r, sink);
    }
  }

  if (auto r = database.Execute(db::sql::UpdateSchemaVersion(step.target_version)); !r) {
    return Abort(*tx, step, Result::Err(r.code, "cannot record schema version: " + r.message), sink);
  }

  if (auto r = tx->Commit(); !r) {
    return Abort(*tx, step, Result::Err(r.code, "commit failed: " + r.message), sink);
  }

  return Result::Ok();
}

} // namespace schemaver::schema
