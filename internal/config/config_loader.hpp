#pragma once

#include <string>

#include "config/config.pb.h"

namespace trailmap::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  type mismatches are rejected with the protobuf parser's message.
*/
class ConfigLoader {
 public:
  static trailmap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static trailmap::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace trailmap::config
