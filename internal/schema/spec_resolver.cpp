#include "internal/schema/spec_resolver.hpp"

#include <algorithm>

namespace schemaver::schema {

namespace {

StepResolution Fail(std::string message) {
  StepResolution r;
  r.outcome = ResolveOutcome::SpecError;
  r.message = std::move(message);
  return r;
}

StepResolution Apply(StepKind kind, int target, const StatementList& statements, bool create_table) {
  StepResolution r;
  r.outcome                       = ResolveOutcome::Step;
  r.step.kind                     = kind;
  r.step.target_version           = target;
  r.step.statements               = statements;
  r.step.create_bookkeeping_table = create_table;
  return r;
}

StepResolution Upgrade(const SchemaSpec& spec, int current, bool create_table) {
  const int next = current + 1;
  const auto* statements = spec.FindUpgradeTo(next);
  if (!statements) {
    return Fail("spec has no upgrade_to_version[" + std::to_string(next) + "]");
  }
  return Apply(StepKind::Upgrade, next, *statements, create_table);
}

} // namespace

int ResolveLatestVersion(const SchemaSpec& spec) {
  if (spec.latest_version.has_value()) {
    return *spec.latest_version;
  }

  int latest = 1;
  if (!spec.upgrade_to_version.empty()) {
    latest = std::max(latest, spec.upgrade_to_version.rbegin()->first);
  }
  return latest;
}

StepResolution ResolveStep(const SchemaSpec& spec, const VersionState& current, std::optional<int> bootstrap_version) {
  const int latest = ResolveLatestVersion(spec);
  if (latest < 1) {
    return Fail("latest_version must be at least 1, got " + std::to_string(latest));
  }

  if (current.version > latest) {
    StepResolution r;
    r.outcome = ResolveOutcome::VersionSkew;
    r.message = "database schema version (" + std::to_string(current.version) +
                ") is newer than the spec's latest version (" + std::to_string(latest) +
                "), the application probably needs to be upgraded first";
    return r;
  }

  if (current.version == latest) {
    return StepResolution{};
  }

  if (current.version > 0) {
    return Upgrade(spec, current.version, false);
  }

  const bool create_table = !current.has_bookkeeping_table;

  if (bootstrap_version.has_value()) {
    const int k = *bootstrap_version;
    if (k < 1 || k > latest) {
      return Fail("cannot create schema at version " + std::to_string(k) + ", valid versions are 1.." +
                  std::to_string(latest));
    }
    const auto* statements = spec.FindInstallAt(k);
    if (!statements) {
      return Fail("spec has no install_at_version[" + std::to_string(k) + "]");
    }
    return Apply(StepKind::InstallAtVersion, k, *statements, create_table);
  }

  if (spec.install.has_value()) {
    return Apply(StepKind::Install, latest, *spec.install, create_table);
  }

  if (spec.FindUpgradeTo(1)) {
    return Upgrade(spec, 0, create_table);
  }

  return Fail("no install path available: spec has neither install nor upgrade_to_version[1]");
}

} // namespace schemaver::schema
