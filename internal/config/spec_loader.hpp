#pragma once

#include <string>

#include "internal/schema/schema_spec.hpp"

namespace schemaver::config {

/*
  Loads a SchemaSpec from YAML.

    latest_version: 3
    install:
      - CREATE TABLE t1 (...)
    install_at_version:
      1:
        - CREATE TABLE t1 (...)
    upgrade_to_version:
      2:
        - ALTER TABLE t1 ADD COLUMN c5 INT
      3: []

  or the sequential form, where entry i builds version i+1:

    steps:
      - [CREATE TABLE t1 (...)]
      - [ALTER TABLE t1 ADD COLUMN c5 INT]

  Throws util::InvalidSpec on anything else.
*/
class SpecLoader {
 public:
  static schema::SchemaSpec LoadFromYaml(const std::string& path);
  static schema::SchemaSpec ParseYaml(const std::string& text);
};

} // namespace schemaver::config
