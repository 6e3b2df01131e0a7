#pragma once

#include <string>

#include "config/config.pb.h"

namespace releaselog::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Loaded configs have WithDefaults() applied.
*/
class ConfigLoader {
 public:
  static releaselog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static releaselog::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Replaces zero/empty values with the documented defaults.
  static releaselog::runtime::config::RuntimeConfig WithDefaults(releaselog::runtime::config::RuntimeConfig config);
};

} // namespace releaselog::config
