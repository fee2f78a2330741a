#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/database.hpp"
#include "internal/schema/diagnostics.hpp"
#include "internal/schema/schema_spec.hpp"

namespace schemaver::schema {

// Produces a fresh, empty database for each call.
using DatabaseFactory = std::function<std::shared_ptr<db::Database>()>;

struct SpecCheckFinding {
  std::string check;
  std::string message;
};

struct SpecCheckReport {
  std::vector<SpecCheckFinding> findings;
  std::vector<std::string>      install_tables;
  std::vector<std::string>      upgrade_tables;

  explicit operator bool() const {
    return findings.empty();
  }
};

/*
  SpecChecker

  Verifies an authored spec before it ships:

    - latest version >= 1, install present
    - install_at_version[1] present when latest > 1
    - upgrade_to_version[2..latest] all present
    - install on an empty database reaches latest
    - install_at_version[1] + upgrades reaches latest
    - both paths leave the same set of tables

  Each run gets its own database from the factory.
*/
class SpecChecker {
 public:
  explicit SpecChecker(DatabaseFactory factory, std::shared_ptr<DiagnosticSink> sink = nullptr);

  SpecCheckReport Check(const SchemaSpec& spec) const;

 private:
  // Migrates a fresh database; tables are listed only when the run reached latest.
  bool RunPath(const SchemaSpec& spec, std::optional<int> bootstrap_version, const std::string& check,
               SpecCheckReport* report, std::vector<std::string>* tables) const;

  DatabaseFactory                 factory_;
  std::shared_ptr<DiagnosticSink> sink_;
};

} // namespace schemaver::schema
