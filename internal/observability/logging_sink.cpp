#include "internal/observability/logging_sink.hpp"

#include <stdexcept>
#include <string>

namespace schemaver::observability {
namespace {

spdlog::level::level_enum ToLevel(schema::Severity severity) {
  switch (severity) {
    case schema::Severity::Debug:
      return spdlog::level::debug;
    case schema::Severity::Info:
      return spdlog::level::info;
    case schema::Severity::Warn:
      return spdlog::level::warn;
    case schema::Severity::Error:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

} // namespace

LoggingSink::LoggingSink(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
  if (!logger_) {
    throw std::invalid_argument("LoggingSink requires a logger");
  }
}

void LoggingSink::Emit(schema::Severity severity, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = FormatFields(fields);

  if (!serialized_fields.empty()) {
    logger_->log(ToLevel(severity), "{} {}", message, serialized_fields);
    return;
  }
  logger_->log(ToLevel(severity), "{}", message);
}

} // namespace schemaver::observability
