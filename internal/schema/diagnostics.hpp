#pragma once

#include <initializer_list>
#include <string_view>

#include "internal/observability/log_field.hpp"

namespace schemaver::schema {

using observability::LogField;

enum class Severity { Debug, Info, Warn, Error };

/*
  Where the engine reports what it is doing.

  Injected into MigrationEngine / SpecChecker; the engine never
  reaches for a process-wide logger on its own.
*/
class DiagnosticSink {
 public:
  virtual ~DiagnosticSink() = default;

  virtual void Emit(Severity severity, std::string_view message, std::initializer_list<LogField> fields) = 0;

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Emit(Severity::Debug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Emit(Severity::Info, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Emit(Severity::Warn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Emit(Severity::Error, message, fields);
  }
};

class NullDiagnosticSink final : public DiagnosticSink {
 public:
  void Emit(Severity, std::string_view, std::initializer_list<LogField>) override {
  }
};

} // namespace schemaver::schema
