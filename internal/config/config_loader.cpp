#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace recall::config {

namespace {

// UTC-12:00 .. UTC+14:00
constexpr int kMinUtcOffsetMinutes = -12 * 60;
constexpr int kMaxUtcOffsetMinutes = 14 * 60;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

recall::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  recall::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

recall::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

recall::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const recall::runtime::config::RuntimeConfig& config) {
  const auto& scheduler = config.scheduler();

  if (scheduler.max_due_limit() != 0 && scheduler.default_due_limit() > scheduler.max_due_limit()) {
    throw std::runtime_error("Invalid configuration: scheduler.default_due_limit exceeds scheduler.max_due_limit");
  }

  if (scheduler.has_replay_window() && (scheduler.replay_window().seconds() < 0 || scheduler.replay_window().nanos() < 0)) {
    throw std::runtime_error("Invalid configuration: scheduler.replay_window must not be negative");
  }

  if (scheduler.has_due_soon_window() && (scheduler.due_soon_window().seconds() < 0 || scheduler.due_soon_window().nanos() < 0)) {
    throw std::runtime_error("Invalid configuration: scheduler.due_soon_window must not be negative");
  }

  const int offset = scheduler.day_boundary_utc_offset_minutes();
  if (offset < kMinUtcOffsetMinutes || offset > kMaxUtcOffsetMinutes) {
    throw std::runtime_error("Invalid configuration: scheduler.day_boundary_utc_offset_minutes out of range");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && level != "trace" && level != "debug" && level != "info" && level != "warn" && level != "error" && level != "critical" &&
      level != "off") {
    throw std::runtime_error("Invalid configuration: logging.level '" + level + "' is not a known level");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace recall::config
