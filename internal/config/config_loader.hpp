#pragma once

#include <string>

#include "config/config.pb.h"

namespace vaultsync::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON and parsed into the
  message. Unknown keys are rejected so typos fail at startup.
*/
class ConfigLoader {
 public:
  static vaultsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static vaultsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills zero-valued sync/relay tunables with defaults.
  static void ApplyDefaults(vaultsync::runtime::config::RuntimeConfig* config);
};

} // namespace vaultsync::config
