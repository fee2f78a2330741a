#pragma once

#include <stdexcept>
#include <string>

namespace schemaver::util {

/*
  Central error types for everything outside the engine.

  The CLI maps these to exit codes; the engine itself never
  throws them and reports through MigrationResult instead.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidSpec : public std::runtime_error {
 public:
  explicit InvalidSpec(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace schemaver::util
