#pragma once

#include <string>

#include "config/config.pb.h"

namespace recsync::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are an
  error. Defaults for fields left unset are applied by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static recsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static recsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(recsync::runtime::config::RuntimeConfig& config);
};

} // namespace recsync::config
