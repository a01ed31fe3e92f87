#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/projection/projection_config.hpp"

namespace chronicle::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. All failures throw util::ValidationError.
*/
class ConfigLoader {
 public:
  static chronicle::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static chronicle::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Projection section with defaults applied and validated.
  static projection::ProjectionConfig ProjectionSettings(const chronicle::runtime::config::RuntimeConfig& config);

  // "250ms", "10s", "2m"
  static std::chrono::milliseconds ParseDuration(std::string_view text);

  static bool IsValidProjectionName(std::string_view name);
};

} // namespace chronicle::config
