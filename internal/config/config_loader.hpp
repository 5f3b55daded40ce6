#pragma once

#include <string>

#include "config/config.pb.h"

namespace docbuild::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset values are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static docbuild::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static docbuild::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(docbuild::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument on inconsistent settings.
  static void Validate(const docbuild::runtime::config::RuntimeConfig& config);
};

} // namespace docbuild::config
