#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace chronicle::config {

using chronicle::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
      throw util::ValidationError("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document -> all defaults
  if (!yaml.IsDefined() || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ValidationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ValidationError("Invalid configuration: " + std::string(status.message()));
  }

  // validates eagerly so a bad file fails at load time
  ConfigLoader::ProjectionSettings(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

std::chrono::milliseconds ConfigLoader::ParseDuration(std::string_view text) {
  std::size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
    ++digits;
  }

  if (digits == 0) {
    throw util::ValidationError("invalid duration '" + std::string(text) + "': expected <number>ms|s|m");
  }

  const auto amount = std::stoull(std::string(text.substr(0, digits)));
  const auto unit   = text.substr(digits);

  if (unit == "ms") return std::chrono::milliseconds(amount);
  if (unit == "s") return std::chrono::seconds(amount);
  if (unit == "m") return std::chrono::minutes(amount);

  throw util::ValidationError("invalid duration '" + std::string(text) + "': unknown unit '" + std::string(unit) + "'");
}

bool ConfigLoader::IsValidProjectionName(std::string_view name) {
  if (name.empty()) return false;
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
  }
  return true;
}

projection::ProjectionConfig ConfigLoader::ProjectionSettings(const RuntimeConfig& config) {
  const auto&                  p = config.projection();
  projection::ProjectionConfig out;

  if (!p.name().empty()) out.name = p.name();
  if (!IsValidProjectionName(out.name)) {
    throw util::ValidationError("invalid projection name '" + out.name + "': expected [A-Za-z0-9_-]+");
  }

  if (p.has_batch_size()) out.batch_size = p.batch_size();
  if (out.batch_size == 0) {
    throw util::ValidationError("projection.batch_size must be at least 1");
  }

  if (p.has_max_retries()) out.max_retries = p.max_retries();
  if (!p.initial_retry_delay().empty()) out.initial_retry_delay = ParseDuration(p.initial_retry_delay());
  if (!p.max_retry_delay().empty()) out.max_retry_delay = ParseDuration(p.max_retry_delay());

  if (p.has_retry_backoff_multiplier()) out.retry_backoff_multiplier = p.retry_backoff_multiplier();
  if (out.retry_backoff_multiplier < 1.0) {
    throw util::ValidationError("projection.retry_backoff_multiplier must be >= 1.0");
  }

  if (p.has_lag_warning_threshold()) out.lag_warning_threshold = p.lag_warning_threshold();
  if (p.has_lag_error_threshold()) out.lag_error_threshold = p.lag_error_threshold();
  if (out.lag_warning_threshold > out.lag_error_threshold) {
    throw util::ValidationError("projection.lag_warning_threshold must not exceed lag_error_threshold");
  }

  if (!p.poll_interval().empty()) out.poll_interval = ParseDuration(p.poll_interval());
  if (out.poll_interval.count() == 0) {
    throw util::ValidationError("projection.poll_interval must be positive");
  }

  if (p.has_auto_start()) out.auto_start = p.auto_start();
  if (!p.health_log_interval().empty()) out.health_log_interval = ParseDuration(p.health_log_interval());

  return out;
}

} // namespace chronicle::config
