#pragma once

#include <string>

#include "config/config.pb.h"

namespace sqlvault::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Environment overrides are applied on top of the file:

    SQLVAULT_ENV           -> environment
    BACKUP_RETENTION_DAYS  -> backup.retention_days
    BACKUP_INTERVAL        -> schedule.interval_hours
*/
class ConfigLoader {
 public:
  static sqlvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sqlvault::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);

  static void ApplyEnvironmentOverrides(sqlvault::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig on unsupported enum-like values.
  static void Validate(const sqlvault::runtime::config::RuntimeConfig& config);
};

} // namespace sqlvault::config
