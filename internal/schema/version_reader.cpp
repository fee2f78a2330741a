#include "internal/schema/version_reader.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"

namespace schemaver::schema {

using db::ErrorCode;
using db::Result;

namespace {

std::optional<int> ParseVersion(const std::string& text) {
  int         value = 0;
  const char* first = text.data();
  const char* last  = text.data() + text.size();

  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value < 0) {
    return std::nullopt;
  }
  return value;
}

} // namespace

Result ReadCurrentVersion(db::Database& database, VersionState* state) {
  *state = VersionState{};

  std::vector<std::string> tables;
  if (auto r = database.ListTables(db::sql::BOOKKEEPING_TABLE, &tables); !r) {
    return Result::Err(r.code, "cannot list tables: " + r.message);
  }

  // LIKE may be case-insensitive depending on the backend
  auto found = std::find(tables.begin(), tables.end(), db::sql::BOOKKEEPING_TABLE);
  if (found == tables.end()) {
    return Result::Ok();
  }
  state->has_bookkeeping_table = true;

  std::optional<std::string> value;
  if (auto r = database.QueryScalar(db::sql::SELECT_SCHEMA_VERSION, &value); !r) {
    return Result::Err(r.code, "cannot read schema version: " + r.message);
  }

  if (!value.has_value()) {
    return Result::Err(ErrorCode::InvalidState, "bookkeeping table 'meta' has no schema_version row");
  }

  auto version = ParseVersion(*value);
  if (!version.has_value()) {
    return Result::Err(ErrorCode::Corruption, "schema_version value '" + *value + "' is not a version number");
  }

  state->version = *version;
  return Result::Ok();
}

} // namespace schemaver::schema
