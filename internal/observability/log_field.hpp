#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace schemaver::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by single spaces
std::string FormatFields(std::initializer_list<LogField> fields);

} // namespace schemaver::observability
