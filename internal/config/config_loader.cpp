#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace ledger::config {

namespace {

constexpr const char* kDefaultBindAddress   = "0.0.0.0:50051";
constexpr uint64_t    kDefaultLockTtlMs     = 10000;
constexpr uint32_t    kDefaultRetryCount    = 3;
constexpr uint64_t    kDefaultRetryDelayMs  = 200;
constexpr uint64_t    kDefaultRetryJitterMs = 100;
constexpr uint64_t    kDefaultIntervalMs    = 60000;
constexpr uint32_t    kDefaultRateRequests  = 100;
constexpr uint64_t    kDefaultRateWindowMs  = 60000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("45000" for a string field).
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

ledger::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  ledger::runtime::config::RuntimeConfig config;

  // An empty document keeps every default.
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
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

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

ledger::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

ledger::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(node);
}

void ConfigLoader::ApplyDefaults(ledger::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* database = config.mutable_database();
  if (database->has_sqlite() && database->sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database->has_postgres()) {
    if (database->postgres().connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
    }
    if (database->postgres().max_connections() == 0) database->mutable_postgres()->set_max_connections(16);
  }

  auto* locks = config.mutable_locks();
  if (locks->default_ttl_ms() == 0) locks->set_default_ttl_ms(kDefaultLockTtlMs);
  if (locks->retry_count() == 0) locks->set_retry_count(kDefaultRetryCount);
  if (locks->retry_delay_ms() == 0) locks->set_retry_delay_ms(kDefaultRetryDelayMs);
  if (locks->retry_jitter_ms() == 0) locks->set_retry_jitter_ms(kDefaultRetryJitterMs);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->interval_ms() == 0) scheduler->set_interval_ms(kDefaultIntervalMs);

  auto* policy = config.mutable_policy();
  if (policy->requests_per_window() == 0) policy->set_requests_per_window(kDefaultRateRequests);
  if (policy->window_ms() == 0) policy->set_window_ms(kDefaultRateWindowMs);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

} // namespace ledger::config
