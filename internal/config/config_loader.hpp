#pragma once

#include <string>

#include "config/config.pb.h"

namespace forecast::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static forecast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static forecast::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Cross-field checks the schema cannot express. Throws util::ConfigurationError.
  static void Validate(const forecast::runtime::config::RuntimeConfig& config);
};

} // namespace forecast::config
