#include "internal/schema/version_reader.hpp"

#include <cassert>
#include <iostream>

#include "tests/support/fake_database.hpp"

namespace {

using schemaver::db::ErrorCode;
using schemaver::schema::ReadCurrentVersion;
using schemaver::schema::VersionState;
using schemaver::testing::FakeDatabase;

void TestMissingTableMeansVersionZero() {
  FakeDatabase db;
  VersionState state;
  state.version = 42;

  auto r = ReadCurrentVersion(db, &state);
  assert(r);
  assert(state.version == 0);
  assert(!state.has_bookkeeping_table);
  assert(db.calls.size() == 1);
  assert(db.calls[0] == "list_tables");
}

void TestReadsStoredVersion() {
  FakeDatabase db;
  db.committed.has_meta      = true;
  db.committed.version_value = "4";

  VersionState state;
  auto         r = ReadCurrentVersion(db, &state);
  assert(r);
  assert(state.version == 4);
  assert(state.has_bookkeeping_table);
  assert(db.MutatingCalls() == 0);
}

void TestTableWithoutRowIsError() {
  FakeDatabase db;
  db.committed.has_meta = true;

  VersionState state;
  auto         r = ReadCurrentVersion(db, &state);
  assert(!r);
  assert(r.code == ErrorCode::InvalidState);
  assert(r.message.find("schema_version") != std::string::npos);
}

void TestGarbageVersionIsError() {
  FakeDatabase db;
  db.committed.has_meta      = true;
  db.committed.version_value = "3beta";

  VersionState state;
  auto         r = ReadCurrentVersion(db, &state);
  assert(!r);
  assert(r.code == ErrorCode::Corruption);
  assert(r.message.find("3beta") != std::string::npos);
}

void TestNegativeVersionIsError() {
  FakeDatabase db;
  db.committed.has_meta      = true;
  db.committed.version_value = "-1";

  VersionState state;
  assert(!ReadCurrentVersion(db, &state));
}

void TestListTablesFailurePropagates() {
  FakeDatabase db;
  db.fail_list_tables = true;

  VersionState state;
  auto         r = ReadCurrentVersion(db, &state);
  assert(!r);
  assert(r.code == ErrorCode::IOError);
  assert(r.message.find("disk I/O error") != std::string::npos);
}

} // namespace

int main() {
  TestMissingTableMeansVersionZero();
  TestReadsStoredVersion();
  TestTableWithoutRowIsError();
  TestGarbageVersionIsError();
  TestNegativeVersionIsError();
  TestListTablesFailurePropagates();

  std::cout << "schemaver_unit_version_reader: pass\n";
  return 0;
}
