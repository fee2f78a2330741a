#include "internal/schema/migration_step.hpp"

namespace schemaver::schema {

const char* StepKindName(StepKind kind) {
  switch (kind) {
    case StepKind::Install:
      return "install";
    case StepKind::InstallAtVersion:
      return "install_at_version";
    case StepKind::Upgrade:
      return "upgrade";
  }
  return "unknown";
}

} // namespace schemaver::schema
