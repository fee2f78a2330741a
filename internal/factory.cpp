#include "factory.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/spec_loader.hpp"
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging_sink.hpp"
#if SCHEMAVER_DB_POSTGRES
#include "internal/db/postgres/pg_database.hpp"
#endif

namespace schemaver::factory {

std::shared_ptr<db::Database> BuildDatabase(const schemaver::runtime::config::DatabaseConfig& config) {
  if (config.has_sqlite()) {
    db::sqlite::SqliteOptions options;
    options.path     = config.sqlite().path();
    options.wal_mode = config.sqlite().wal_mode();
    if (config.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = config.sqlite().busy_timeout_ms();
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    return std::make_shared<db::sqlite::SqliteDatabase>(std::move(sqlite_db));
  }

  if (config.has_postgres()) {
#if SCHEMAVER_DB_POSTGRES
    return std::make_shared<db::postgres::PgDatabase>(config.postgres().connection_uri());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no database backend configured");
}

/*
    Build full application dependency graph
*/
Application Build(const schemaver::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Spec first: a bad spec should not cost a database connection
  // ------------------------------------------------------------------
  app.spec = config::SpecLoader::LoadFromYaml(config.migration().spec_path());
  if (config.migration().create_from_version() > 0) {
    app.bootstrap_version = config.migration().create_from_version();
  }

  // ------------------------------------------------------------------
  // Database + engine
  // ------------------------------------------------------------------
  app.database = BuildDatabase(config.database());
  app.sink     = std::make_shared<observability::LoggingSink>(spdlog::default_logger());
  app.engine   = std::make_unique<schema::MigrationEngine>(app.database, app.sink);

  return app;
}

} // namespace schemaver::factory
