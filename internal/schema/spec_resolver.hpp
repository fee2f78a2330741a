#pragma once

#include <optional>
#include <string>

#include "internal/schema/migration_step.hpp"
#include "internal/schema/schema_spec.hpp"
#include "internal/schema/version_reader.hpp"

namespace schemaver::schema {

enum class ResolveOutcome {
  Step,         // apply `step`
  UpToDate,     // current == latest
  SpecError,    // spec cannot get us further
  VersionSkew   // database is newer than the spec
};

struct StepResolution {
  ResolveOutcome outcome = ResolveOutcome::UpToDate;
  MigrationStep  step;
  std::string    message;
};

// latest_version if set, else the highest upgrade_to_version key, else 1.
int ResolveLatestVersion(const SchemaSpec& spec);

/*
  Picks the next step for a database at `current`.

  From version 0:
    bootstrap_version K -> install_at_version[K], records K
    install             -> install, records latest (no history replay)
    upgrade_to_version[1] -> ordinary step 0 -> 1
  Otherwise the step is always upgrade_to_version[current + 1].
*/
StepResolution ResolveStep(const SchemaSpec& spec, const VersionState& current, std::optional<int> bootstrap_version);

} // namespace schemaver::schema
