#pragma once

#include <string>

#include "config/config.pb.h"

namespace nove::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, printed as JSON and
  parsed into the RuntimeConfig message, so unknown keys are rejected
  with the proto field path in the error. Quoted scalars stay strings.

  Load() = parse, then environment overrides, then defaults, then
  validation. Errors are thrown as std::runtime_error.
*/
class ConfigLoader {
 public:
  static nove::runtime::config::RuntimeConfig Load(const std::string& path);

  static nove::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static nove::runtime::config::RuntimeConfig ParseYaml(const std::string& text);

  // NOVE_ADMIN_TOKEN, NOVE_DB_PATH, NOVE_DATABASE_URL, NOVE_SMTP_PASSWORD,
  // NOVE_MAIL_API_KEY, NOVE_NOTIFY_TO
  static void ApplyEnvironmentOverrides(nove::runtime::config::RuntimeConfig& config);

  static void ApplyDefaults(nove::runtime::config::RuntimeConfig& config);

  static void Validate(const nove::runtime::config::RuntimeConfig& config);
};

} // namespace nove::config
