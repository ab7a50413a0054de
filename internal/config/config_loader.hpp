#pragma once

#include <string>

#include "config/config.pb.h"

namespace booking::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; durations use the protobuf JSON form ("3600s").
*/
class ConfigLoader {
 public:
  static booking::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static booking::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Throws std::runtime_error on out-of-range values.
  static void Validate(const booking::runtime::config::RuntimeConfig& config);
};

} // namespace booking::config
