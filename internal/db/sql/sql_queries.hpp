#pragma once

#include <string>

namespace schemaver::db::sql {

/*
  Bookkeeping SQL used by all backends.

  IMPORTANT:
  These are written in the subset understood by SQLite, Postgres
  and MySQL alike. The engine never builds any other SQL.
*/

static constexpr const char* BOOKKEEPING_TABLE = "meta";
static constexpr const char* SCHEMA_VERSION_KEY = "schema_version";

static constexpr const char* CREATE_BOOKKEEPING_TABLE =
    "CREATE TABLE meta (name VARCHAR(64) NOT NULL PRIMARY KEY, value VARCHAR(255))";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO meta (name,value) VALUES ('schema_version','0')";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT value FROM meta WHERE name='schema_version'";

inline std::string UpdateSchemaVersion(int version) {
  return "UPDATE meta SET value='" + std::to_string(version) + "' WHERE name='schema_version'";
}

} // namespace schemaver::db::sql
