#pragma once

#include "internal/db/api/database.hpp"

namespace schemaver::schema {

struct VersionState {
  int  version               = 0;
  bool has_bookkeeping_table = false;
};

/*
  Reads the recorded schema version.

  No bookkeeping table   -> version 0, has_bookkeeping_table=false
  Table without the row  -> error (InvalidState)
  Non-integer value      -> error (Corruption)

  Read-only: issues ListTables and QueryScalar, nothing else.
*/
db::Result ReadCurrentVersion(db::Database& database, VersionState* state);

} // namespace schemaver::schema
