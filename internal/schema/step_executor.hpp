#pragma once

#include "internal/db/api/database.hpp"
#include "internal/schema/diagnostics.hpp"
#include "internal/schema/migration_step.hpp"

namespace schemaver::schema {

/*
  Applies one MigrationStep inside a single transaction:

    BEGIN
    [CREATE TABLE meta + INSERT schema_version=0]
    statements... (stops at the first rejected one)
    UPDATE meta SET value=<target>
    COMMIT

  Any failure rolls the whole transaction back. The returned
  message names the target version and carries the driver's text.
*/
db::Result ApplyStep(db::Database& database, const MigrationStep& step, DiagnosticSink& sink);

} // namespace schemaver::schema
