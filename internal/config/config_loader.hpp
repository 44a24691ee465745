#pragma once

#include <string>

#include "config/config.pb.h"

namespace market::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and type mismatches are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static market::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static market::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace market::config
