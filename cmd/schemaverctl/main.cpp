#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "internal/config/spec_loader.hpp"
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging_sink.hpp"
#include "internal/schema/migration_engine.hpp"
#include "internal/schema/spec_checker.hpp"
#include "internal/schema/spec_resolver.hpp"
#include "internal/schema/version_reader.hpp"

using namespace schemaver;

static void Usage() {
  std::cout << "Usage:\n"
            << "  schemaverctl <sqlite-path> status\n"
            << "  schemaverctl <sqlite-path> migrate <spec.yaml> [from_version]\n"
            << "  schemaverctl check <spec.yaml>\n";
}

static std::shared_ptr<db::Database> OpenSqlite(const std::string& path) {
  db::sqlite::SqliteOptions options;
  options.path = path;
  return std::make_shared<db::sqlite::SqliteDatabase>(std::make_shared<db::sqlite::SqliteDB>(std::move(options)));
}

static std::shared_ptr<schema::DiagnosticSink> MakeSink() {
  auto logger = spdlog::stderr_color_mt("schemaverctl");
  logger->set_level(spdlog::level::warn);
  if (const char* level = std::getenv("SCHEMAVER_LOG_LEVEL")) {
    logger->set_level(spdlog::level::from_str(level));
  }
  return std::make_shared<observability::LoggingSink>(std::move(logger));
}

static int Check(const std::string& spec_path) {
  auto spec = config::SpecLoader::LoadFromYaml(spec_path);

  schema::SpecChecker checker([] { return OpenSqlite(":memory:"); }, MakeSink());
  auto                report = checker.Check(spec);

  for (const auto& finding : report.findings) {
    std::cout << "not ok - " << finding.check << ": " << finding.message << "\n";
  }
  if (report) {
    std::cout << "ok - spec builds version " << schema::ResolveLatestVersion(spec) << " (" << report.install_tables.size()
              << " tables)\n";
    return 0;
  }
  return 3;
}

static int Status(const std::string& db_path) {
  auto database = OpenSqlite(db_path);

  schema::VersionState state;
  auto                 r = schema::ReadCurrentVersion(*database, &state);
  if (!r) {
    std::cerr << "cannot read schema version: " << r.message << "\n";
    return 4;
  }

  std::cout << "schema_version=" << state.version << " bookkeeping_table=" << (state.has_bookkeeping_table ? "yes" : "no")
            << "\n";
  return 0;
}

static int Migrate(const std::string& db_path, const std::string& spec_path, std::optional<int> from_version) {
  auto spec = config::SpecLoader::LoadFromYaml(spec_path);

  schema::MigrationEngine engine(OpenSqlite(db_path), MakeSink());
  auto                    result = engine.Run(spec, from_version);

  std::cout << result.StatusValue() << " " << result.message << " (version " << result.version << ")\n";
  return result ? 0 : (result.status == schema::StatusCode::SpecError ? 3 : 4);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string first = argv[1];
  std::string cmd   = argv[2];

  try {
    if (first == "check") {
      return Check(cmd);
    }

    if (cmd == "status") {
      return Status(first);
    }

    if (cmd == "migrate") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      std::optional<int> from_version;
      if (argc >= 5) {
        from_version = std::stoi(argv[4]);
      }
      return Migrate(first, argv[3], from_version);
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
