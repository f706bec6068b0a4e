#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/numbers.hpp"

namespace sqlvault::config {

using sqlvault::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
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
    case YAML::NodeType::Undefined:
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

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
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
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static uint32_t ParseUnsigned(const char* name, const std::string& text) {
  const auto value = util::ParseUint32(text);
  if (!value) {
    throw util::InvalidConfig(std::string(name) + " must be a non-negative integer no larger than " +
                              std::to_string(std::numeric_limits<uint32_t>::max()) + ", got '" + text + "'");
  }
  return *value;
}

static double ParsePositiveDouble(const char* name, const std::string& text) {
  char*        endptr = nullptr;
  const double value  = std::strtod(text.c_str(), &endptr);
  if (text.empty() || !endptr || *endptr != '\0' || !(value > 0.0)) {
    throw util::InvalidConfig(std::string(name) + " must be a positive number, got '" + text + "'");
  }
  return value;
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

  auto config = FromYamlNode(yaml);
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = FromYamlNode(yaml);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* env = std::getenv("SQLVAULT_ENV")) {
    config.set_environment(env);
  }

  if (const char* retention = std::getenv("BACKUP_RETENTION_DAYS")) {
    config.mutable_backup()->set_retention_days(ParseUnsigned("BACKUP_RETENTION_DAYS", retention));
  }

  if (const char* interval = std::getenv("BACKUP_INTERVAL")) {
    config.mutable_schedule()->set_interval_hours(ParsePositiveDouble("BACKUP_INTERVAL", interval));
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& schedule = config.schedule();

  const auto& type = schedule.type();
  if (!type.empty() && type != "interval" && type != "cron" && type != "manual") {
    throw util::InvalidConfig("schedule.type must be interval, cron or manual, got '" + type + "'");
  }

  const auto& backup_type = schedule.backup_type();
  if (!backup_type.empty() && backup_type != "full" && backup_type != "schema") {
    throw util::InvalidConfig("schedule.backup_type must be full or schema, got '" + backup_type + "'");
  }

  if (schedule.has_interval_hours() && !(schedule.interval_hours() > 0.0)) {
    throw util::InvalidConfig("schedule.interval_hours must be positive");
  }

  if (type == "cron" && schedule.cron_expression().empty()) {
    throw util::InvalidConfig("schedule.cron_expression is required for cron schedules");
  }

  if (config.backup().has_batch_size() && config.backup().batch_size() == 0) {
    throw util::InvalidConfig("backup.batch_size must be at least 1");
  }
}

} // namespace sqlvault::config
