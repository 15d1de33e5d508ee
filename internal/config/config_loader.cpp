#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstdint>
#include <stdexcept>

namespace roombook::config {

namespace {

constexpr std::uint32_t kDefaultLockTimeoutMs        = 2000;
constexpr std::uint32_t kDefaultPersistRetryBackoff  = 50;
constexpr std::uint32_t kDefaultMaxOccurrences       = 500;
constexpr std::uint32_t kDefaultMaxHorizonDays       = 730;
constexpr std::uint32_t kDefaultMinDurationMinutes   = 30;
constexpr std::uint32_t kDefaultMaxDurationMinutes   = 7 * 24 * 60;
constexpr std::uint32_t kDefaultMaxParallelRooms     = 8;
constexpr std::uint32_t kDefaultMaxDeliveryAttempts  = 5;
constexpr std::uint32_t kDefaultDeliveryRetryBackoff = 100;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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

static roombook::runtime::config::RuntimeConfig ParseNode(const YAML::Node& yaml) {
  roombook::runtime::config::RuntimeConfig config;

  // An empty document means "all defaults".
  if (!yaml.IsNull()) {
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

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

roombook::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseNode(yaml);
}

roombook::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseNode(yaml);
}

void ConfigLoader::ApplyDefaults(roombook::runtime::config::RuntimeConfig* config) {
  if (!config->database().has_memory() && !config->database().has_sqlite()) {
    config->mutable_database()->mutable_memory();
  }

  auto* admission = config->mutable_admission();
  if (admission->lock_timeout_ms() == 0) admission->set_lock_timeout_ms(kDefaultLockTimeoutMs);
  if (admission->persist_retry_backoff_ms() == 0) admission->set_persist_retry_backoff_ms(kDefaultPersistRetryBackoff);

  auto* recurrence = config->mutable_recurrence();
  if (recurrence->max_occurrences() == 0) recurrence->set_max_occurrences(kDefaultMaxOccurrences);
  if (recurrence->max_horizon_days() == 0) recurrence->set_max_horizon_days(kDefaultMaxHorizonDays);

  auto* policy = config->mutable_booking_policy();
  if (policy->min_duration_minutes() == 0) policy->set_min_duration_minutes(kDefaultMinDurationMinutes);
  if (policy->max_duration_minutes() == 0) policy->set_max_duration_minutes(kDefaultMaxDurationMinutes);
  if (policy->min_duration_minutes() > policy->max_duration_minutes()) {
    throw std::runtime_error("Invalid configuration: booking_policy.min_duration_minutes exceeds max_duration_minutes");
  }

  auto* availability = config->mutable_availability();
  if (availability->max_parallel_rooms() == 0) availability->set_max_parallel_rooms(kDefaultMaxParallelRooms);

  auto* events = config->mutable_events();
  if (events->sink().empty()) events->set_sink("log");
  if (events->sink() != "log" && events->sink() != "none") {
    throw std::runtime_error("Invalid configuration: events.sink must be 'log' or 'none', got '" + events->sink() + "'");
  }
  if (events->max_delivery_attempts() == 0) events->set_max_delivery_attempts(kDefaultMaxDeliveryAttempts);
  if (events->retry_backoff_ms() == 0) events->set_retry_backoff_ms(kDefaultDeliveryRetryBackoff);

  if (config->database().has_sqlite() && config->database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  for (const auto& room : config->rooms()) {
    if (room.id().empty()) {
      throw std::runtime_error("Invalid configuration: every room needs an id");
    }
  }
}

} // namespace roombook::config
