#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace schemaver::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidConfig("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const schemaver::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw util::InvalidConfig("Invalid configuration: database.sqlite.path is empty");
    }
    if (database.sqlite().busy_timeout_ms() < 0) {
      throw util::InvalidConfig("Invalid configuration: database.sqlite.busy_timeout_ms is negative");
    }
  } else if (database.has_postgres()) {
    if (database.postgres().connection_uri().empty()) {
      throw util::InvalidConfig("Invalid configuration: database.postgres.connection_uri is empty");
    }
  } else {
    throw util::InvalidConfig("Invalid configuration: database must be one of sqlite, postgres");
  }

  if (config.migration().spec_path().empty()) {
    throw util::InvalidConfig("Invalid configuration: migration.spec_path is required");
  }
  if (config.migration().create_from_version() < 0) {
    throw util::InvalidConfig("Invalid configuration: migration.create_from_version is negative");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    throw util::InvalidConfig("Invalid configuration: unknown logging.level '" + level + "'");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

schemaver::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  schemaver::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);

  // spec_path is relative to the config file, not the working directory
  auto& migration = *config.mutable_migration();
  if (!migration.spec_path().empty()) {
    std::filesystem::path spec_path(migration.spec_path());
    if (spec_path.is_relative()) {
      migration.set_spec_path((std::filesystem::path(path).parent_path() / spec_path).lexically_normal().string());
    }
  }

  return config;
}

} // namespace schemaver::config
