#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobsrv::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; zero or empty fields take their defaults.
*/
class ConfigLoader {
 public:
  static jobsrv::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its default and rejects inconsistent values.
  static void ApplyDefaults(jobsrv::runtime::config::RuntimeConfig& config);
};

} // namespace jobsrv::config
