#pragma once

#include "internal/schema/schema_spec.hpp"

namespace schemaver::schema {

enum class StepKind {
  Install,           // install -> latest version
  InstallAtVersion,  // install_at_version[K] -> K
  Upgrade            // upgrade_to_version[K] -> K
};

const char* StepKindName(StepKind kind);

/*
  One unit of work: statements + bookkeeping update, applied in
  a single transaction.
*/
struct MigrationStep {
  StepKind      kind           = StepKind::Upgrade;
  int           target_version = 0;
  StatementList statements;

  // Only on the very first step of a database without a bookkeeping table.
  bool create_bookkeeping_table = false;
};

} // namespace schemaver::schema
