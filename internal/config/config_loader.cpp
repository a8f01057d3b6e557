#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace chatlog::config {

using chatlog::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings ("123" is not a number).
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // An empty document is a valid all-defaults config.
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

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
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(node);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* database = config->mutable_database();
  if (database->backend_case() == chatlog::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->lock_timeout_ms() == 0) {
    database->set_lock_timeout_ms(kDefaultLockTimeoutMs);
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    if (sqlite->busy_timeout_ms() == 0) {
      sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
    }
    if (!sqlite->has_wal_mode()) {
      sqlite->set_wal_mode(true);
    }
  }
  if (database->has_postgres()) {
    auto* postgres = database->mutable_postgres();
    if (postgres->connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
    }
    if (postgres->max_connections() == 0) {
      postgres->set_max_connections(kDefaultMaxConnections);
    }
    if (postgres->statement_timeout_ms() == 0) {
      postgres->set_statement_timeout_ms(kDefaultStatementTimeoutMs);
    }
    if (postgres->acquire_timeout_ms() == 0) {
      postgres->set_acquire_timeout_ms(kDefaultAcquireTimeoutMs);
    }
  }

  auto* loader = config->mutable_loader();
  if (loader->page_size() == 0) {
    loader->set_page_size(kDefaultPageSize);
  }

  auto* projector = config->mutable_projector();
  if (!projector->has_enabled()) {
    projector->set_enabled(true);
  }
  if (projector->catch_up_interval_ms() == 0) {
    projector->set_catch_up_interval_ms(kDefaultCatchUpIntervalMs);
  }
  if (projector->catch_up_batch_size() == 0) {
    projector->set_catch_up_batch_size(kDefaultCatchUpBatchSize);
  }
  if (projector->retry_backoff_ms() == 0) {
    projector->set_retry_backoff_ms(kDefaultRetryBackoffMs);
  }

  auto* recovery = config->mutable_recovery();
  if (!recovery->has_enabled()) {
    recovery->set_enabled(true);
  }
  if (recovery->sweep_interval_ms() == 0) {
    recovery->set_sweep_interval_ms(kDefaultSweepIntervalMs);
  }
  if (recovery->streaming_timeout_ms() == 0) {
    recovery->set_streaming_timeout_ms(kDefaultStreamingTimeoutMs);
  }
}

} // namespace chatlog::config
