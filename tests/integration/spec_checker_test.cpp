#include "internal/schema/spec_checker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_database.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using schemaver::schema::SchemaSpec;
using schemaver::schema::SpecCheckReport;
using schemaver::schema::SpecChecker;

std::shared_ptr<schemaver::db::Database> MakeScratchDatabase() {
  schemaver::db::sqlite::SqliteOptions options;
  options.path = ":memory:";
  return std::make_shared<schemaver::db::sqlite::SqliteDatabase>(std::make_shared<schemaver::db::sqlite::SqliteDB>(options));
}

SchemaSpec ConsistentSpec() {
  SchemaSpec spec;
  spec.latest_version        = 3;
  spec.install               = {"CREATE TABLE t1 (c1 INT)", "CREATE TABLE t4 (c1 INT)"};
  spec.install_at_version[1] = {"CREATE TABLE t1 (c1 INT)", "CREATE TABLE t2 (c1 INT)", "CREATE TABLE t3 (c1 INT)"};
  spec.upgrade_to_version[2] = {"CREATE TABLE t4 (c1 INT)", "DROP TABLE t3"};
  spec.upgrade_to_version[3] = {"DROP TABLE t2"};
  return spec;
}

bool HasFinding(const SpecCheckReport& report, const std::string& check) {
  for (const auto& finding : report.findings) {
    if (finding.check == check) return true;
  }
  return false;
}

void TestConsistentSpecPasses() {
  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(ConsistentSpec());
  assert(report);
  assert((report.install_tables == std::vector<std::string>{"meta", "t1", "t4"}));
  assert(report.install_tables == report.upgrade_tables);
}

void TestSingleVersionSpecNeedsNoUpgradePath() {
  SchemaSpec spec;
  spec.latest_version = 1;
  spec.install        = {"CREATE TABLE t1 (c1 INT)"};

  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(spec);
  assert(report);
  assert(report.upgrade_tables.empty());
}

void TestDivergentPathsAreReported() {
  auto spec                  = ConsistentSpec();
  spec.upgrade_to_version[3] = {"SELECT 1"};

  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(spec);
  assert(!report);
  assert(HasFinding(report, "equivalence"));
  assert(report.findings.size() == 1);
  assert(report.findings[0].message.find("t2") != std::string::npos);
}

void TestBrokenInstallIsReported() {
  auto spec    = ConsistentSpec();
  spec.install = {"CREATE TABLE t1 (c1 INT)", "CREAT TABLE t4 (c1 INT)"};

  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(spec);
  assert(HasFinding(report, "install_path"));
  assert(!HasFinding(report, "upgrade_path"));
  assert(!HasFinding(report, "equivalence"));
}

void TestMissingPiecesAreReported() {
  SchemaSpec spec;
  spec.latest_version        = 3;
  spec.upgrade_to_version[2] = {"CREATE TABLE t2 (c1 INT)"};

  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(spec);
  assert(HasFinding(report, "install"));
  assert(HasFinding(report, "install_at_version"));
  assert(HasFinding(report, "upgrade_chain"));
  assert(!HasFinding(report, "install_path"));
  assert(!HasFinding(report, "upgrade_path"));
}

void TestEmptySpecIsReported() {
  SpecChecker checker(MakeScratchDatabase);
  auto        report = checker.Check(SchemaSpec{});
  assert(HasFinding(report, "install"));
  assert(report.findings.size() == 1);

  SchemaSpec zero;
  zero.latest_version = 0;
  report              = checker.Check(zero);
  assert(HasFinding(report, "latest_version"));
  assert(report.findings.size() == 1);
}

void TestFactoryFailureIsReported() {
  SpecChecker checker([]() -> std::shared_ptr<schemaver::db::Database> { throw std::runtime_error("no scratch space"); });
  auto        report = checker.Check(ConsistentSpec());
  assert(HasFinding(report, "install_path"));
  assert(HasFinding(report, "upgrade_path"));
}

} // namespace

int main() {
  TestConsistentSpecPasses();
  TestSingleVersionSpecNeedsNoUpgradePath();
  TestDivergentPathsAreReported();
  TestBrokenInstallIsReported();
  TestMissingPiecesAreReported();
  TestEmptySpecIsReported();
  TestFactoryFailureIsReported();

  std::cout << "schemaver_integration_spec_checker: pass\n";
  return 0;
}
