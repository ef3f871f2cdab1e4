#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace nove::config {

using nove::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultInstallCommand = "curl -fsSL https://noveos.jp/install.sh | sudo bash -s -- --license {key}";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // "!" is the tag yaml-cpp gives quoted scalars.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  if (!scalar.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(scalar.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(scalar);
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
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
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
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* token = Env("NOVE_ADMIN_TOKEN")) {
    config.mutable_admin()->set_token(token);
  }
  if (const char* path = Env("NOVE_DB_PATH")) {
    config.mutable_database()->mutable_sqlite()->set_path(path);
  }
  if (const char* url = Env("NOVE_DATABASE_URL")) {
    config.mutable_database()->mutable_postgres()->set_connection_uri(url);
  }
  if (const char* password = Env("NOVE_SMTP_PASSWORD")) {
    config.mutable_notification()->mutable_smtp()->set_password(password);
  }
  if (const char* key = Env("NOVE_MAIL_API_KEY")) {
    config.mutable_notification()->mutable_mail_api()->set_api_key(key);
  }
  if (const char* to = Env("NOVE_NOTIFY_TO")) {
    config.mutable_notification()->set_operator_address(to);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0");
  if (server->port() == 0) server->set_port(8000);
  if (server->request_timeout_ms() == 0) server->set_request_timeout_ms(30000);
  if (server->max_body_bytes() == 0) server->set_max_body_bytes(1 << 20);

  auto* database = config.mutable_database();
  switch (database->backend_case()) {
    case nove::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
#if NOVE_DB_SQLITE
      database->mutable_sqlite()->set_path("nove_os.db");
#else
      database->mutable_memory();
#endif
      break;
    case nove::runtime::config::DatabaseConfig::kSqlite:
      if (database->sqlite().path().empty()) database->mutable_sqlite()->set_path("nove_os.db");
      break;
    case nove::runtime::config::DatabaseConfig::kPostgres:
      if (database->postgres().max_connections() == 0) database->mutable_postgres()->set_max_connections(4);
      break;
    case nove::runtime::config::DatabaseConfig::kMemory:
      break;
  }

  auto* cors = config.mutable_cors();
  if (cors->allowed_origins_size() == 0) {
    for (const char* origin : {"https://noveos.jp", "https://*.netlify.app", "http://localhost:8080", "http://localhost:3000"}) {
      cors->add_allowed_origins(origin);
    }
  }

  auto* license = config.mutable_license();
  if (license->key_prefix().empty()) license->set_key_prefix("NOVE");
  if (license->install_command_template().empty()) license->set_install_command_template(kDefaultInstallCommand);

  auto* notification = config.mutable_notification();
  if (notification->worker_threads() == 0) notification->set_worker_threads(2);
  if (notification->queue_capacity() == 0) notification->set_queue_capacity(1024);
  if (notification->timeout_ms() == 0) notification->set_timeout_ms(10000);
  auto* smtp = notification->mutable_smtp();
  if (smtp->host().empty()) smtp->set_host("smtp.gmail.com");
  if (smtp->port() == 0) smtp->set_port(587);
  if (!smtp->has_starttls()) smtp->set_starttls(true);
  if (notification->from_address().empty()) notification->set_from_address(smtp->username());

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* observability = config.mutable_observability();
  if (observability->metrics_interval_ms() == 0) observability->set_metrics_interval_ms(5000);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.server().port() > 65535) {
    throw std::runtime_error("Invalid configuration: server.port out of range");
  }
  if (config.server().max_body_bytes() == 0) {
    throw std::runtime_error("Invalid configuration: server.max_body_bytes must be positive");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.license().install_command_template().find("{key}") == std::string::npos) {
    throw std::runtime_error("Invalid configuration: license.install_command_template must contain {key}");
  }
  for (const auto& origin : config.cors().allowed_origins()) {
    if (origin.empty()) {
      throw std::runtime_error("Invalid configuration: empty cors.allowed_origins entry");
    }
  }
}

} // namespace nove::config
