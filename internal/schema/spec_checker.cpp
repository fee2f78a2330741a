#include "internal/schema/spec_checker.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

#include "internal/schema/migration_engine.hpp"
#include "internal/schema/spec_resolver.hpp"

namespace schemaver::schema {

using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ", ";
    out += item;
  }
  return out.empty() ? "(none)" : out;
}

} // namespace

SpecChecker::SpecChecker(DatabaseFactory factory, std::shared_ptr<DiagnosticSink> sink)
    : factory_(std::move(factory)), sink_(std::move(sink)) {
  if (!factory_) {
    throw std::invalid_argument("SpecChecker requires a database factory");
  }
  if (!sink_) {
    sink_ = std::make_shared<NullDiagnosticSink>();
  }
}

bool SpecChecker::RunPath(const SchemaSpec& spec, std::optional<int> bootstrap_version, const std::string& check,
                          SpecCheckReport* report, std::vector<std::string>* tables) const {
  std::shared_ptr<db::Database> database;
  try {
    database = factory_();
  } catch (const std::exception& e) {
    report->findings.push_back({check, std::string("cannot create scratch database: ") + e.what()});
    return false;
  }
  if (!database) {
    report->findings.push_back({check, "database factory returned no database"});
    return false;
  }

  MigrationEngine engine(database, sink_);
  auto            result = engine.Run(spec, bootstrap_version);
  const int       latest = ResolveLatestVersion(spec);

  if (!result) {
    report->findings.push_back({check, result.message});
    return false;
  }
  if (result.version != latest) {
    report->findings.push_back({check, "reached version " + std::to_string(result.version) + " instead of " +
                                           std::to_string(latest)});
    return false;
  }

  if (auto r = database->ListTables("%", tables); !r) {
    report->findings.push_back({check, "cannot list tables: " + r.message});
    return false;
  }
  std::sort(tables->begin(), tables->end());
  return true;
}

SpecCheckReport SpecChecker::Check(const SchemaSpec& spec) const {
  SpecCheckReport report;
  const int       latest = ResolveLatestVersion(spec);

  if (latest < 1) {
    report.findings.push_back({"latest_version", "latest version must be >= 1, got " + std::to_string(latest)});
    return report;
  }

  if (!spec.install.has_value()) {
    report.findings.push_back({"install", "spec has no install script"});
  }

  if (latest > 1 && !spec.FindInstallAt(1)) {
    report.findings.push_back({"install_at_version", "spec has no install_at_version[1] (needed to test upgrades)"});
  }

  std::vector<std::string> missing;
  for (int k = 2; k <= latest; ++k) {
    if (!spec.FindUpgradeTo(k)) missing.push_back(std::to_string(k));
  }
  if (!missing.empty()) {
    report.findings.push_back({"upgrade_chain", "spec has no upgrade_to_version for: " + Join(missing)});
  }

  bool install_ok = false;
  if (spec.install.has_value()) {
    sink_->Info("checking install path", {IntField("latest", latest)});
    install_ok = RunPath(spec, std::nullopt, "install_path", &report, &report.install_tables);
  }

  bool upgrade_ok = false;
  if (latest > 1 && spec.FindInstallAt(1) && missing.empty()) {
    sink_->Info("checking upgrade path", {IntField("from", 1), IntField("latest", latest)});
    upgrade_ok = RunPath(spec, 1, "upgrade_path", &report, &report.upgrade_tables);
  }

  if (install_ok && upgrade_ok && report.install_tables != report.upgrade_tables) {
    std::vector<std::string> only_install;
    std::vector<std::string> only_upgrade;
    std::set_difference(report.install_tables.begin(), report.install_tables.end(), report.upgrade_tables.begin(),
                        report.upgrade_tables.end(), std::back_inserter(only_install));
    std::set_difference(report.upgrade_tables.begin(), report.upgrade_tables.end(), report.install_tables.begin(),
                        report.install_tables.end(), std::back_inserter(only_upgrade));
    report.findings.push_back({"equivalence", "install and upgrade paths disagree; only after install: " +
                                                  Join(only_install) + "; only after upgrades: " + Join(only_upgrade)});
  }

  for (const auto& finding : report.findings) {
    sink_->Warn("spec check failed", {StringField("check", finding.check), StringField("message", finding.message)});
  }
  return report;
}

} // namespace schemaver::schema
