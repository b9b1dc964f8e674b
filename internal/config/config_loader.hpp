#pragma once

#include <string>

#include "config/config.pb.h"

namespace linecheck::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment overrides
  and defaults are applied afterwards, then the result is validated.
*/
class ConfigLoader {
 public:
  static linecheck::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset value with its default.
  static void ApplyDefaults(linecheck::runtime::config::RuntimeConfig& config);
  // LINECHECK_SUPERVISOR_PIN replaces line.supervisor_pin when set.
  static void ApplyEnvironmentOverrides(linecheck::runtime::config::RuntimeConfig& config);
  // Throws std::runtime_error on the first invalid setting.
  static void Validate(const linecheck::runtime::config::RuntimeConfig& config);
};

} // namespace linecheck::config
