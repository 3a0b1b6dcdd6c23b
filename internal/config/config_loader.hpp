#pragma once

#include <string>

#include "config/config.pb.h"

namespace recall::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected and durations use the protobuf JSON form ("30s", "7200s").
*/
class ConfigLoader {
 public:
  static recall::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static recall::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Throws std::runtime_error on inconsistent limits, an unknown log
  // level or a database section missing its location.
  static void Validate(const recall::runtime::config::RuntimeConfig& config);
};

} // namespace recall::config
