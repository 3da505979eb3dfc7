#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace gallery::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static gallery::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static gallery::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static gallery::runtime::config::RuntimeConfig FromNode(const YAML::Node& yaml);
};

} // namespace gallery::config
