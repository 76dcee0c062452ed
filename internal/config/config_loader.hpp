#pragma once

#include <string>

#include "config/config.pb.h"

namespace storygraph::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static storygraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static storygraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Branch name used when a caller names none.
  static std::string DefaultBranchName(const storygraph::runtime::config::RuntimeConfig& config);
};

} // namespace storygraph::config
