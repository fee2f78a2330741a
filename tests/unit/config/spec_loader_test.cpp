#include "internal/config/spec_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using schemaver::config::SpecLoader;
using schemaver::schema::StatementList;

bool Rejects(const std::string& text) {
  try {
    (void)SpecLoader::ParseYaml(text);
  } catch (const schemaver::util::InvalidSpec&) {
    return true;
  }
  return false;
}

void TestVersionedFormIsParsed() {
  auto spec = SpecLoader::ParseYaml(R"(latest_version: 3
install:
  - CREATE TABLE t1 (c1 INT)
  - CREATE TABLE t4 (c1 INT)
install_at_version:
  1:
    - CREATE TABLE t1 (c1 INT)
upgrade_to_version:
  2:
    - "ALTER TABLE t1 ADD COLUMN c5 INT"
  3: []
)");

  assert(spec.latest_version == 3);
  assert(spec.install.has_value());
  assert(spec.install->size() == 2);
  assert((*spec.install)[1] == "CREATE TABLE t4 (c1 INT)");
  assert(spec.FindInstallAt(1) != nullptr);
  assert(spec.FindInstallAt(2) == nullptr);
  assert(spec.FindUpgradeTo(1) == nullptr);
  assert((*spec.FindUpgradeTo(2) == StatementList{"ALTER TABLE t1 ADD COLUMN c5 INT"}));
  assert(spec.FindUpgradeTo(3) != nullptr && spec.FindUpgradeTo(3)->empty());
}

void TestNullStatementListIsEmpty() {
  auto spec = SpecLoader::ParseYaml(R"(latest_version: 2
upgrade_to_version:
  1:
    - CREATE TABLE t1 (c1 INT)
  2:
)");
  assert(spec.FindUpgradeTo(2) != nullptr);
  assert(spec.FindUpgradeTo(2)->empty());
  assert(!spec.install.has_value());
}

void TestSequentialFormBuildsUpgradeChain() {
  auto spec = SpecLoader::ParseYaml(R"(steps:
  - [CREATE TABLE t1 (c1 INT), CREATE TABLE t2 (c1 INT)]
  - [DROP TABLE t2]
)");

  assert(spec.latest_version == 2);
  assert(!spec.install.has_value());
  assert(spec.install_at_version.empty());
  assert(spec.FindUpgradeTo(1)->size() == 2);
  assert((*spec.FindUpgradeTo(2) == StatementList{"DROP TABLE t2"}));
}

void TestMalformedSpecsAreRejected() {
  assert(Rejects("- just\n- a\n- list\n"));
  assert(Rejects("latest_version: 0\n"));
  assert(Rejects("latest_version: three\n"));
  assert(Rejects("latest_version: 1\nuninstall: []\n"));
  assert(Rejects("latest_version: 1\nupgrade_to_version:\n  0: []\n"));
  assert(Rejects("latest_version: 1\nupgrade_to_version:\n  1: CREATE TABLE t1 (c1 INT)\n"));
  assert(Rejects("latest_version: 1\ninstall:\n  - [nested]\n"));
  assert(Rejects("latest_version: 1\nupgrade_to_version:\n  1: []\n  01: []\n"));
  assert(Rejects("steps:\n  - []\nlatest_version: 1\n"));
  assert(Rejects("latest_version: [1\n"));
}

void TestLoadFromFileReportsPath() {
  const auto base_dir = std::filesystem::temp_directory_path() / "schemaver_spec_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto good = base_dir / "good.yaml";
  {
    std::ofstream out(good);
    out << "latest_version: 1\ninstall:\n  - CREATE TABLE t1 (c1 INT)\n";
  }
  auto spec = SpecLoader::LoadFromYaml(good.string());
  assert(spec.latest_version == 1);

  const auto bad = base_dir / "bad.yaml";
  {
    std::ofstream out(bad);
    out << "latest_version: 1\nextra: true\n";
  }
  bool threw = false;
  try {
    (void)SpecLoader::LoadFromYaml(bad.string());
  } catch (const schemaver::util::InvalidSpec& e) {
    threw = std::string(e.what()).find(bad.string()) != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)SpecLoader::LoadFromYaml((base_dir / "missing.yaml").string());
  } catch (const schemaver::util::InvalidSpec&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestVersionedFormIsParsed();
  TestNullStatementListIsEmpty();
  TestSequentialFormBuildsUpgradeChain();
  TestMalformedSpecsAreRejected();
  TestLoadFromFileReportsPath();

  std::cout << "schemaver_unit_spec_loader: pass\n";
  return 0;
}
