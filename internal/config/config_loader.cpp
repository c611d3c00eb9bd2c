#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace redis_ipc::config {

using redis_ipc::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("6379", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Semantic checks protobuf cannot express
// ------------------------------------------------------------

template <typename Entries>
static void RequireUniqueNames(const Entries& entries, const std::string& section) {
  std::unordered_set<std::string> seen;
  for (const auto& entry : entries) {
    if (entry.name().empty()) {
      throw std::runtime_error("Invalid configuration: " + section + " entry without name");
    }
    if (!seen.insert(entry.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate " + section + " name '" + entry.name() + "'");
    }
  }
}

static void Validate(const RuntimeConfig& config) {
  const auto& backend = config.store().backend();
  if (!backend.empty() && backend != "redis" && backend != "memory") {
    throw std::runtime_error("Invalid configuration: store.backend must be 'redis' or 'memory', got '" + backend + "'");
  }
  if (config.store().port() > 65535) {
    throw std::runtime_error("Invalid configuration: store.port out of range");
  }

  RequireUniqueNames(config.caches(), "caches");
  RequireUniqueNames(config.queues(), "queues");
  RequireUniqueNames(config.streams(), "streams");

  for (const auto& stream : config.streams()) {
    if (!stream.start().empty() && stream.start() != "beginning" && stream.start() != "latest") {
      throw std::runtime_error("Invalid configuration: streams." + stream.name() + ".start must be 'beginning' or 'latest'");
    }
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_content);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

} // namespace redis_ipc::config
