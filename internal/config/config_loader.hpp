#pragma once

#include <string>

#include "config/config.pb.h"

namespace releasectl::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so enum fields take
  their proto names (OTLP_TRANSPORT_HTTP, LOG_FORMAT_JSON). Unknown fields are
  rejected; unset tunables are filled in by ApplyDefaults. Load errors throw
  std::runtime_error, out-of-range values std::invalid_argument.
*/
class ConfigLoader {
 public:
  static releasectl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static releasectl::runtime::config::RuntimeConfig LoadFromString(const std::string& text);

  static void ApplyDefaults(releasectl::runtime::config::RuntimeConfig* config);
  static void Validate(const releasectl::runtime::config::RuntimeConfig& config);
};

} // namespace releasectl::config
