#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/migration_result.hpp"

using schemaver::observability::IntField;
using schemaver::observability::StringField;
using schemaver::schema::StatusCode;

static int ExitCodeFor(StatusCode status) {
  switch (status) {
    case StatusCode::Ok:
      return 0;
    case StatusCode::SpecError:
      return 3;
    case StatusCode::ExecutionError:
      return 4;
  }
  return 4;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: schemaver <config.yaml> OR schemaver --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = schemaver::config::ConfigLoader::LoadFromYaml(config_path);

    schemaver::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (spec, database, engine)
    // ------------------------------------------------------------
    auto app = schemaver::factory::Build(config);

    SCHEMAVER_LOG_INFO("Migrating schema", {StringField("backend", app.database->BackendName()),
                                            StringField("spec", config.migration().spec_path())});

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    auto result = app.engine->Run(app.spec, app.bootstrap_version);

    if (result) {
      SCHEMAVER_LOG_INFO("Schema is current", {IntField("version", result.version), IntField("from", result.from_version)});
    } else {
      SCHEMAVER_LOG_ERROR("Schema migration failed", {IntField("status", result.StatusValue()), IntField("version", result.version),
                                                      StringField("error", result.message)});
    }

    schemaver::observability::ShutdownLogging();
    return ExitCodeFor(result.status);
  } catch (const std::exception& e) {
    SCHEMAVER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    schemaver::observability::ShutdownLogging();
    return 2;
  }
}
