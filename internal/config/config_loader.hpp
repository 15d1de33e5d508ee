#pragma once

#include <string>

#include "config/config.pb.h"

namespace roombook::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset sections fall
  back to the defaults applied by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static roombook::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static roombook::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(roombook::runtime::config::RuntimeConfig* config);
};

} // namespace roombook::config
