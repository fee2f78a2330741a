#include "spec_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace schemaver::config {

using schema::SchemaSpec;
using schema::StatementList;

static int ParseVersionKey(const YAML::Node& key, const std::string& where) {
  const std::string text = key.IsScalar() ? key.Scalar() : std::string();

  int  value     = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || value < 1) {
    throw util::InvalidSpec(where + ": '" + text + "' is not a positive version number");
  }
  return value;
}

static StatementList ParseStatements(const YAML::Node& node, const std::string& where) {
  StatementList statements;
  if (node.IsNull()) {
    return statements;
  }
  if (!node.IsSequence()) {
    throw util::InvalidSpec(where + ": expected a list of SQL statements");
  }

  statements.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (!node[i].IsScalar()) {
      throw util::InvalidSpec(where + "[" + std::to_string(i) + "]: expected a SQL string");
    }
    statements.push_back(node[i].Scalar());
  }
  return statements;
}

static std::map<int, StatementList> ParseVersionMap(const YAML::Node& node, const std::string& where) {
  if (!node.IsMap()) {
    throw util::InvalidSpec(where + ": expected a mapping of version -> statements");
  }

  std::map<int, StatementList> out;
  for (auto it : node) {
    const int version = ParseVersionKey(it.first, where);
    auto      label   = where + "[" + std::to_string(version) + "]";
    if (!out.emplace(version, ParseStatements(it.second, label)).second) {
      throw util::InvalidSpec(label + ": defined twice");
    }
  }
  return out;
}

static SchemaSpec ParseSequential(const YAML::Node& node) {
  if (!node.IsSequence()) {
    throw util::InvalidSpec("steps: expected a list of statement lists");
  }

  std::vector<StatementList> steps;
  steps.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    steps.push_back(ParseStatements(node[i], "steps[" + std::to_string(i) + "]"));
  }
  return SchemaSpec::FromSequentialSteps(std::move(steps));
}

static SchemaSpec FromNode(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw util::InvalidSpec("schema spec must be a mapping");
  }

  if (root["steps"]) {
    if (root.size() != 1) {
      throw util::InvalidSpec("steps cannot be combined with other keys");
    }
    return ParseSequential(root["steps"]);
  }

  SchemaSpec spec;
  for (auto it : root) {
    const std::string key = it.first.IsScalar() ? it.first.Scalar() : std::string("<non-scalar>");

    if (key == "latest_version") {
      spec.latest_version = ParseVersionKey(it.second, key);
    } else if (key == "install") {
      spec.install = ParseStatements(it.second, key);
    } else if (key == "install_at_version") {
      spec.install_at_version = ParseVersionMap(it.second, key);
    } else if (key == "upgrade_to_version") {
      spec.upgrade_to_version = ParseVersionMap(it.second, key);
    } else {
      throw util::InvalidSpec("unknown key '" + key + "' in schema spec");
    }
  }
  return spec;
}

SchemaSpec SpecLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidSpec("Failed to load YAML spec '" + path + "': " + std::string(e.what()));
  }

  try {
    return FromNode(yaml);
  } catch (const util::InvalidSpec& e) {
    throw util::InvalidSpec(path + ": " + e.what());
  }
}

SchemaSpec SpecLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidSpec("Failed to parse YAML spec: " + std::string(e.what()));
  }
  return FromNode(yaml);
}

} // namespace schemaver::config
