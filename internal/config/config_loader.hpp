#pragma once

#include <string>

#include "config/config.pb.h"

namespace curator::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static curator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static curator::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace curator::config
