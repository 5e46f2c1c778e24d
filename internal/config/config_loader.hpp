#pragma once

#include <string>

#include "config/config.pb.h"

namespace rvault::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings, so base58 addresses made of
  digits survive the conversion.
*/
class ConfigLoader {
 public:
  static rvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rvault::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace rvault::config
