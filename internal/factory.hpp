#pragma once

#include <memory>
#include <optional>

#include "config/config.pb.h"

#include "internal/db/api/database.hpp"
#include "internal/schema/diagnostics.hpp"
#include "internal/schema/migration_engine.hpp"
#include "internal/schema/schema_spec.hpp"

namespace schemaver::factory {

/*
  Application

  Everything one schemaver run needs, wired from RuntimeConfig.
*/
struct Application {
  std::shared_ptr<db::Database>            database;
  std::shared_ptr<schema::DiagnosticSink>  sink;
  std::unique_ptr<schema::MigrationEngine> engine;

  schema::SchemaSpec spec;
  std::optional<int> bootstrap_version;
};

/*
  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.

  Throws std::runtime_error when the database cannot be opened or
  the requested backend was not compiled in, util::InvalidSpec when
  the spec file is malformed.
*/
std::shared_ptr<db::Database> BuildDatabase(const schemaver::runtime::config::DatabaseConfig& config);

Application Build(const schemaver::runtime::config::RuntimeConfig& config);

} // namespace schemaver::factory
