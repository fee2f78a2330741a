#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/database.hpp"
#include "internal/schema/diagnostics.hpp"
#include "internal/schema/migration_result.hpp"
#include "internal/schema/schema_spec.hpp"

namespace schemaver::schema {

/*
  MigrationEngine

  Brings a database to the spec's latest schema version, one
  transaction per version step:

    Start    -> read recorded version, reject version skew
    Stepping -> resolve next step, apply, re-read version
    Done     -> 200
    Failed   -> 400 (spec) / 500 (database), version = last committed

  A failed run can simply be repeated once the cause is fixed: it
  resumes from the last committed version.

  Thread Safety: NOT thread-safe. The database handle is owned by
  one Run() at a time, and concurrent runs against the same
  database from other processes must be serialized by the caller.
*/
class MigrationEngine {
 public:
  explicit MigrationEngine(std::shared_ptr<db::Database> database, std::shared_ptr<DiagnosticSink> sink = nullptr);

  MigrationEngine(const MigrationEngine&)            = delete;
  MigrationEngine& operator=(const MigrationEngine&) = delete;

  // bootstrap_version: on an empty database, build install_at_version[K]
  // instead of install, then upgrade from there.
  MigrationResult Run(const SchemaSpec& spec, std::optional<int> bootstrap_version = std::nullopt);

 private:
  std::shared_ptr<db::Database>   db_;
  std::shared_ptr<DiagnosticSink> sink_;
};

} // namespace schemaver::schema
