#pragma once

#include <string>

#include "config/config.pb.h"

namespace credit::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to google.protobuf.Value, printed as JSON and parsed
  into the message, so the proto schema is the single source of truth for
  key names and enum spellings. Unknown keys are an error.

  After parsing, defaults are applied (memory database, system clock,
  sequence start 1) and the result is validated. Every failure throws
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static credit::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static credit::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(credit::runtime::config::RuntimeConfig& config);
  static void Validate(const credit::runtime::config::RuntimeConfig& config);
};

} // namespace credit::config
