#pragma once

#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace dashstream::config {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Missing durations and counts are filled from defaults, and
  DASHSTREAM_SESSION_SECRET overrides session.token_secret.
*/
class ConfigLoader {
 public:
  static dashstream::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config with every default applied; used when no file is given.
  static dashstream::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(dashstream::runtime::config::RuntimeConfig& config);
};

} // namespace dashstream::config
