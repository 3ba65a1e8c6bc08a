#pragma once

#include <string>

#include "config/config.pb.h"

namespace sqlmigrate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. After parsing, environment overrides and defaults are applied
  and the result is validated. Every failure is a std::runtime_error.
*/
class ConfigLoader {
 public:
  static sqlmigrate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static sqlmigrate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // POSTGRES_HOST/PORT/DB/USER/PASSWORD, SQLMIGRATE_MIGRATIONS_DIR
  static void ApplyEnvironment(sqlmigrate::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(sqlmigrate::runtime::config::RuntimeConfig& config);
  static void Validate(const sqlmigrate::runtime::config::RuntimeConfig& config);
};

// libpq conninfo string; connection_uri wins over the discrete fields.
std::string PostgresConnectionString(const sqlmigrate::runtime::config::PostgresConfig& postgres);

} // namespace sqlmigrate::config
