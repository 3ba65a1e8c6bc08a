#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "internal/db/sql/identifier.hpp"

namespace sqlmigrate::config {

using sqlmigrate::runtime::config::PostgresConfig;
using sqlmigrate::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultDirectory     = "migrations";
constexpr const char* kDefaultExtension     = ".sql";
constexpr const char* kDefaultTrackingTable = "migrations";
constexpr const char* kDefaultPostgresHost  = "localhost";
constexpr uint32_t    kDefaultPostgresPort  = 5432;
constexpr uint32_t    kDefaultBusyTimeoutMs = 5000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars ("5432", 'true') are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig Finish(RuntimeConfig config) {
  ConfigLoader::ApplyEnvironment(config);
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

uint32_t ParsePort(const std::string& text) {
  char*               endptr = nullptr;
  const unsigned long port   = std::strtoul(text.c_str(), &endptr, 10);
  if (text.empty() || !endptr || *endptr != '\0' || port == 0 || port > 65535) {
    throw std::runtime_error("Invalid configuration: POSTGRES_PORT '" + text + "' is not a port number");
  }
  return static_cast<uint32_t>(port);
}

// single-quoted conninfo value, escaping ' and backslash
std::string QuoteConninfo(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Finish(ParseYaml(yaml));
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Finish(ParseYaml(yaml));
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  const char* host     = Env("POSTGRES_HOST");
  const char* port     = Env("POSTGRES_PORT");
  const char* database = Env("POSTGRES_DB");
  const char* user     = Env("POSTGRES_USER");
  const char* password = Env("POSTGRES_PASSWORD");

  const bool any_postgres_env = host || port || database || user || password;
  auto*      db               = config.mutable_database();

  // environment alone may select postgres when the file names no backend
  if (db->backend_case() == runtime::config::DatabaseConfig::BACKEND_NOT_SET && any_postgres_env) {
    db->mutable_postgres();
  }

  if (db->has_postgres()) {
    auto* pg = db->mutable_postgres();
    if (host) pg->set_host(host);
    if (port) pg->set_port(ParsePort(port));
    if (database) pg->set_database(database);
    if (user) pg->set_user(user);
    if (password) pg->set_password(password);
  }

  if (const char* dir = Env("SQLMIGRATE_MIGRATIONS_DIR")) {
    config.mutable_migrations()->set_directory(dir);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* migrations = config.mutable_migrations();
  if (migrations->directory().empty()) migrations->set_directory(kDefaultDirectory);
  if (migrations->extension().empty()) migrations->set_extension(kDefaultExtension);
  if (migrations->tracking_table().empty()) migrations->set_tracking_table(kDefaultTrackingTable);

  auto* db = config.mutable_database();
  if (db->has_sqlite()) {
    if (db->sqlite().busy_timeout_ms() == 0) db->mutable_sqlite()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }
  if (db->has_postgres() && db->postgres().connection_uri().empty()) {
    auto* pg = db->mutable_postgres();
    if (pg->host().empty()) pg->set_host(kDefaultPostgresHost);
    if (pg->port() == 0) pg->set_port(kDefaultPostgresPort);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.backend_case() == runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    throw std::runtime_error("Invalid configuration: database.sqlite or database.postgres is required");
  }
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  // handed to sqlite3_busy_timeout(), which takes an int
  if (database.has_sqlite() && database.sqlite().busy_timeout_ms() > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Invalid configuration: database.sqlite.busy_timeout_ms out of range");
  }
  if (database.has_postgres() && database.postgres().port() > 65535) {
    throw std::runtime_error("Invalid configuration: database.postgres.port out of range");
  }

  const auto& migrations = config.migrations();
  if (migrations.extension().size() < 2 || migrations.extension().front() != '.') {
    throw std::runtime_error("Invalid configuration: migrations.extension must look like '.sql'");
  }
  if (!db::sql::IsPlainIdentifier(migrations.tracking_table())) {
    throw std::runtime_error("Invalid configuration: migrations.tracking_table '" + migrations.tracking_table() +
                             "' is not a plain SQL identifier");
  }
}

std::string PostgresConnectionString(const PostgresConfig& postgres) {
  if (!postgres.connection_uri().empty()) {
    return postgres.connection_uri();
  }

  std::ostringstream conninfo;
  bool               first = true;
  auto               add   = [&](const char* key, const std::string& value) {
    if (value.empty()) return;
    if (!first) conninfo << ' ';
    first = false;
    conninfo << key << '=' << QuoteConninfo(value);
  };

  add("host", postgres.host());
  add("port", postgres.port() ? std::to_string(postgres.port()) : std::string());
  add("dbname", postgres.database());
  add("user", postgres.user());
  add("password", postgres.password());
  return conninfo.str();
}

} // namespace sqlmigrate::config
