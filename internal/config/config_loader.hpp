#pragma once

#include <string>

#include "config/config.pb.h"

namespace cashgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys and
  out-of-range values are rejected with std::runtime_error.
*/
class ConfigLoader {
 public:
  static cashgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static cashgraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const cashgraph::runtime::config::RuntimeConfig& config);
};

} // namespace cashgraph::config
