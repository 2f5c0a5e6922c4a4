#pragma once

#include <string>

#include "config/config.pb.h"

namespace engram::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so a JSON config
  file loads the same way. Unknown fields are rejected. Quoted scalars
  always stay strings.
*/
class ConfigLoader {
 public:
  static engram::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static engram::runtime::config::RuntimeConfig ParseYaml(const std::string& text);
};

} // namespace engram::config
