#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/spec_loader.hpp"
#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/schema/migration_engine.hpp"

namespace {

constexpr const char* kSpec = R"(latest_version: 3
install:
  - CREATE TABLE users (id INTEGER PRIMARY KEY, email TEXT NOT NULL, created_at INTEGER)
  - CREATE INDEX users_email ON users (email)
install_at_version:
  1:
    - CREATE TABLE users (id INTEGER PRIMARY KEY, email TEXT NOT NULL)
upgrade_to_version:
  2:
    - ALTER TABLE users ADD COLUMN created_at INTEGER
  3:
    - CREATE INDEX users_email ON users (email)
)";

void PrintTables(schemaver::db::Database& db) {
  std::vector<std::string> tables;
  if (auto r = db.ListTables("%", &tables); !r) {
    std::cerr << "ListTables failed: " << r.message << '\n';
    return;
  }
  for (const auto& table : tables) {
    std::cout << "  " << table << '\n';
  }
}

} // namespace

int main(int argc, char** argv) {
  // Pass a file path to keep the database between runs; the second run is a no-op.
  schemaver::db::sqlite::SqliteOptions options;
  options.path = argc > 1 ? argv[1] : ":memory:";

  auto spec = schemaver::config::SpecLoader::ParseYaml(kSpec);
  auto db   = std::make_shared<schemaver::db::sqlite::SqliteDatabase>(std::make_shared<schemaver::db::sqlite::SqliteDB>(options));

  schemaver::schema::MigrationEngine engine(db);

  // An optional second argument bootstraps at that version and walks the upgrade chain.
  auto result = engine.Run(spec, argc > 2 ? std::optional<int>(std::stoi(argv[2])) : std::nullopt);
  std::cout << result.StatusValue() << ' ' << result.message << '\n';
  if (!result) {
    return 1;
  }

  std::cout << "tables at version " << result.version << ":\n";
  PrintTables(*db);
  return 0;
}
