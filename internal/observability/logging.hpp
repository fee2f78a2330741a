#pragma once

#include <spdlog/common.h>

#include <initializer_list>
#include <string_view>

#include "internal/observability/log_field.hpp"

namespace schemaver::runtime::config {
class RuntimeConfig;
}

namespace schemaver::observability {

void InitializeLogging(const schemaver::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace schemaver::observability

#define SCHEMAVER_LOG_DEBUG(message, ...) ::schemaver::observability::LogDebug((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_INFO(message, ...) ::schemaver::observability::LogInfo((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_WARN(message, ...) ::schemaver::observability::LogWarn((message), ##__VA_ARGS__)
#define SCHEMAVER_LOG_ERROR(message, ...) ::schemaver::observability::LogError((message), ##__VA_ARGS__)
