#pragma once

#include <string>

#include "config/config.pb.h"

namespace redis_ipc::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static redis_ipc::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static redis_ipc::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_content);
};

} // namespace redis_ipc::config
