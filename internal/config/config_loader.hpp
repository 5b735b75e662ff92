#pragma once

#include <string>

#include "config/config.pb.h"

namespace kag::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. After parsing,
  zero-valued fields receive their defaults, KAG_* environment variables
  override the file, and the result is validated.
*/
class ConfigLoader {
 public:
  static kag::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults + environment, no file.
  static kag::runtime::config::RuntimeConfig LoadDefault();

  static void ApplyDefaults(kag::runtime::config::RuntimeConfig* config);
  static void ApplyEnvironment(kag::runtime::config::RuntimeConfig* config);
  static void Validate(const kag::runtime::config::RuntimeConfig& config);
};

} // namespace kag::config
