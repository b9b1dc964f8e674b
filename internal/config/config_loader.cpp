#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/core/validation.hpp"
#include "internal/util/errors.hpp"

namespace linecheck::config {

using linecheck::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress  = "0.0.0.0:50051";
constexpr const char* kDefaultLineName     = "Line 1";
constexpr const char* kDefaultPin          = "1234";
constexpr uint32_t    kDefaultMaxAttempts  = 5;
constexpr uint32_t    kDefaultLockoutSecs  = 15 * 60;
constexpr uint32_t    kDefaultRecentWindow = 8;
constexpr uint32_t    kDefaultFirstHour    = 8;
constexpr uint32_t    kDefaultLastHour     = 20;
constexpr uint32_t    kDefaultQueueDepth   = 50;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and stay strings ("1234" as a PIN)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* pin = std::getenv("LINECHECK_SUPERVISOR_PIN")) {
    config.mutable_line()->set_supervisor_pin(pin);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == linecheck::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite() && database->sqlite().synchronous().empty()) {
    database->mutable_sqlite()->set_synchronous("full");
  }

  auto* line = config.mutable_line();
  if (line->name().empty()) {
    line->set_name(kDefaultLineName);
  }
  if (line->supervisor_pin().empty()) {
    line->set_supervisor_pin(kDefaultPin);
  }
  if (line->max_pin_attempts() == 0) {
    line->set_max_pin_attempts(kDefaultMaxAttempts);
  }
  if (line->pin_lockout_seconds() == 0) {
    line->set_pin_lockout_seconds(kDefaultLockoutSecs);
  }
  if (line->recent_scan_window() == 0) {
    line->set_recent_scan_window(kDefaultRecentWindow);
  }
  if (!line->has_report_first_hour()) {
    line->set_report_first_hour(kDefaultFirstHour);
  }
  if (!line->has_report_last_hour()) {
    line->set_report_last_hour(kDefaultLastHour);
  }

  if (config.broadcast().subscriber_queue_capacity() == 0) {
    config.mutable_broadcast()->set_subscriber_queue_capacity(kDefaultQueueDepth);
  }

  if (config.hardware().mode().empty()) {
    config.mutable_hardware()->set_mode("simulated");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  try {
    core::ValidatePinFormat(config.line().supervisor_pin());
  } catch (const util::ValidationError& e) {
    throw std::runtime_error("Invalid configuration: line.supervisor_pin: " + std::string(e.what()));
  }

  const auto& line = config.line();
  if (line.report_first_hour() > 23 || line.report_last_hour() > 23 || line.report_first_hour() > line.report_last_hour()) {
    throw std::runtime_error("Invalid configuration: line.report_first_hour/report_last_hour must satisfy 0 <= first <= last <= 23");
  }
  if (line.recent_scan_window() > 100) {
    throw std::runtime_error("Invalid configuration: line.recent_scan_window must be at most 100");
  }
  if (line.max_pin_attempts() > 100) {
    throw std::runtime_error("Invalid configuration: line.max_pin_attempts must be at most 100");
  }
  if (line.pin_lockout_seconds() > 86400) {
    throw std::runtime_error("Invalid configuration: line.pin_lockout_seconds must be at most 86400");
  }
  if (config.broadcast().subscriber_queue_capacity() > 10000) {
    throw std::runtime_error("Invalid configuration: broadcast.subscriber_queue_capacity must be at most 10000");
  }

  if (config.database().has_sqlite()) {
    const auto& sqlite = config.database().sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    if (sqlite.synchronous() != "full" && sqlite.synchronous() != "normal") {
      throw std::runtime_error("Invalid configuration: database.sqlite.synchronous must be 'full' or 'normal'");
    }
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& mode = config.hardware().mode();
  if (mode != "simulated" && mode != "disabled") {
    throw std::runtime_error("Invalid configuration: hardware.mode must be 'simulated' or 'disabled'");
  }
}

} // namespace linecheck::config
