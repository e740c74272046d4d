#pragma once

#include <string>

#include "config/config.pb.h"

namespace brewmon::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Fields left unset receive the defaults below; range checks are
  done by the composition root (factory::Build).
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress    = "0.0.0.0:50061";
  static constexpr uint32_t    kDefaultPollIntervalMs = 2000;

  static brewmon::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static brewmon::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(brewmon::runtime::config::RuntimeConfig& config);
};

} // namespace brewmon::config
