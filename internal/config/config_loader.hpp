#pragma once

#include <string>

#include "config/config.pb.h"

namespace trustnet::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  unknown enum names are rejected with util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static trustnet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static trustnet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace trustnet::config
