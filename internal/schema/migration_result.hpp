#pragma once

#include <string>

namespace schemaver::schema {

enum class StatusCode : int {
  Ok             = 200,
  SpecError      = 400,
  ExecutionError = 500
};

/*
  Outcome of one MigrationEngine::Run.

  version is the schema version actually reached: latest on
  success, the last committed version on failure.
*/
struct MigrationResult {
  StatusCode  status = StatusCode::Ok;
  std::string message;
  int         version      = 0;
  int         from_version = 0;

  static MigrationResult Success(int from_version, int version);
  static MigrationResult SpecFailure(int from_version, int version, std::string message);
  static MigrationResult ExecutionFailure(int from_version, int version, std::string message);

  int StatusValue() const {
    return static_cast<int>(status);
  }

  explicit operator bool() const {
    return status == StatusCode::Ok;
  }
};

} // namespace schemaver::schema
