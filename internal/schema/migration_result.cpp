#include "internal/schema/migration_result.hpp"

namespace schemaver::schema {

MigrationResult MigrationResult::Success(int from_version, int version) {
  MigrationResult r;
  r.status       = StatusCode::Ok;
  r.from_version = from_version;
  r.version      = version;
  if (from_version == version) {
    r.message = "OK (schema already at version " + std::to_string(version) + ")";
  } else {
    r.message = "OK (upgraded from version " + std::to_string(from_version) + " to " + std::to_string(version) + ")";
  }
  return r;
}

MigrationResult MigrationResult::SpecFailure(int from_version, int version, std::string message) {
  MigrationResult r;
  r.status       = StatusCode::SpecError;
  r.from_version = from_version;
  r.version      = version;
  r.message      = "Can't upgrade schema (from version " + std::to_string(from_version) + "): " + message;
  return r;
}

MigrationResult MigrationResult::ExecutionFailure(int from_version, int version, std::string message) {
  MigrationResult r;
  r.status       = StatusCode::ExecutionError;
  r.from_version = from_version;
  r.version      = version;
  r.message      = "Can't upgrade schema (from version " + std::to_string(from_version) + "): " + message;
  return r;
}

} // namespace schemaver::schema
