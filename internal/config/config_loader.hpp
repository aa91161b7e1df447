#pragma once

#include <string>

#include "config/config.pb.h"

namespace audit::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static audit::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml for an in-memory document.
  static audit::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset (zero) fields with defaults and clamps dlq.workers to
  // [1, 8]. Throws std::runtime_error on values that cannot be used.
  static void ApplyDefaults(audit::runtime::config::RuntimeConfig& config);
};

} // namespace audit::config
