#pragma once

#include <string>

#include "config/config.pb.h"

namespace schemaver::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Throws util::InvalidConfig on unreadable or invalid input.
*/
class ConfigLoader {
 public:
  static schemaver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws util::InvalidConfig when a required section is missing or out of range.
  static void Validate(const schemaver::runtime::config::RuntimeConfig& config);
};

} // namespace schemaver::config
