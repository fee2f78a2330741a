#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "internal/schema/diagnostics.hpp"

namespace schemaver::observability {

/*
  DiagnosticSink backed by an spdlog logger.

  The logger is handed in; nothing here touches the default
  logger registry.
*/
class LoggingSink final : public schema::DiagnosticSink {
 public:
  explicit LoggingSink(std::shared_ptr<spdlog::logger> logger);

  void Emit(schema::Severity severity, std::string_view message, std::initializer_list<LogField> fields) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace schemaver::observability
