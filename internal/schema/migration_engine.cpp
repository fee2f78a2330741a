#include "internal/schema/migration_engine.hpp"

#include <stdexcept>
#include <string>

#include "internal/schema/spec_resolver.hpp"
#include "internal/schema/step_executor.hpp"
#include "internal/schema/version_reader.hpp"

namespace schemaver::schema {

using observability::IntField;
using observability::StringField;

namespace {

enum class State { Start, Stepping, Done, Failed };

} // namespace

MigrationEngine::MigrationEngine(std::shared_ptr<db::Database> database, std::shared_ptr<DiagnosticSink> sink)
    : db_(std::move(database)), sink_(std::move(sink)) {
  if (!db_) {
    throw std::invalid_argument("MigrationEngine requires a database");
  }
  if (!sink_) {
    sink_ = std::make_shared<NullDiagnosticSink>();
  }
}

MigrationResult MigrationEngine::Run(const SchemaSpec& spec, std::optional<int> bootstrap_version) {
  const int latest = ResolveLatestVersion(spec);

  State           state = State::Start;
  VersionState    current;
  int             original = 0;
  MigrationResult failure;

  for (;;) {
    switch (state) {
      case State::Start: {
        if (auto r = ReadCurrentVersion(*db_, &current); !r) {
          failure = MigrationResult::ExecutionFailure(0, 0, r.message);
          state   = State::Failed;
          break;
        }
        original = current.version;

        sink_->Debug("current schema version",
                     {StringField("backend", db_->BackendName()), IntField("version", current.version),
                      IntField("latest", latest)});

        if (latest >= 1 && current.version > latest) {
          auto resolution = ResolveStep(spec, current, bootstrap_version);
          failure         = MigrationResult::ExecutionFailure(original, original, resolution.message);
          state           = State::Failed;
          break;
        }
        state = State::Stepping;
        break;
      }

      case State::Stepping: {
        auto resolution = ResolveStep(spec, current, bootstrap_version);

        if (resolution.outcome == ResolveOutcome::UpToDate) {
          state = State::Done;
          break;
        }
        if (resolution.outcome == ResolveOutcome::SpecError) {
          failure = MigrationResult::SpecFailure(original, current.version, "error in spec: " + resolution.message);
          state   = State::Failed;
          break;
        }
        if (resolution.outcome == ResolveOutcome::VersionSkew) {
          failure = MigrationResult::ExecutionFailure(original, current.version, resolution.message);
          state   = State::Failed;
          break;
        }

        const auto& step = resolution.step;
        sink_->Info("applying schema step", {StringField("kind", StepKindName(step.kind)),
                                             IntField("from", current.version), IntField("to", step.target_version)});

        if (auto r = ApplyStep(*db_, step, *sink_); !r) {
          failure = MigrationResult::ExecutionFailure(original, current.version, r.message);
          state   = State::Failed;
          break;
        }

        VersionState after;
        if (auto r = ReadCurrentVersion(*db_, &after); !r) {
          failure = MigrationResult::ExecutionFailure(
              original, step.target_version,
              "version " + std::to_string(step.target_version) + " committed but cannot be read back: " + r.message);
          state = State::Failed;
          break;
        }
        if (after.version != step.target_version || after.version <= current.version) {
          failure = MigrationResult::ExecutionFailure(
              original, after.version,
              "recorded version is " + std::to_string(after.version) + " after step to version " +
                  std::to_string(step.target_version));
          state = State::Failed;
          break;
        }
        current = after;
        break;
      }

      case State::Done: {
        auto result = MigrationResult::Success(original, latest);
        sink_->Info(result.message, {IntField("from", original), IntField("version", latest)});
        return result;
      }

      case State::Failed: {
        sink_->Error(failure.message, {IntField("status", failure.StatusValue()), IntField("version", failure.version)});
        return failure;
      }
    }
  }
}

} // namespace schemaver::schema
