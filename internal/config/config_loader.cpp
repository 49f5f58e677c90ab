#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace relay::config {

using relay::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
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

  ConfigLoader::ApplyDefaults(config);
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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->prefix().empty()) {
    storage->set_prefix(kDefaultStoragePrefix);
  }
  if (storage->backend_case() == relay::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    storage->mutable_memory();
  }
  if (storage->has_sqlite() && storage->sqlite().path().empty()) {
    throw util::InvalidArgument("storage.sqlite.path must not be empty");
  }

  auto* heartbeat = config.mutable_heartbeat();
  if (!heartbeat->has_interval()) {
    heartbeat->mutable_interval()->set_seconds(kDefaultHeartbeatIntervalSecs);
  }
  // the heartbeat ticks in whole milliseconds
  if (heartbeat->interval().seconds() < 0 || heartbeat->interval().nanos() < 0 ||
      (heartbeat->interval().seconds() == 0 && heartbeat->interval().nanos() < kMinHeartbeatIntervalNanos)) {
    throw util::InvalidArgument("heartbeat.interval must be at least 1ms");
  }

  auto* publisher = config.mutable_publisher();
  if (!publisher->has_default_ttl()) {
    publisher->mutable_default_ttl()->set_seconds(kDefaultPublishTtlSecs);
  }
  if (publisher->default_ttl().seconds() <= 0) {
    throw util::InvalidArgument("publisher.default_ttl must be at least one second");
  }
  if (publisher->relay_protocol().empty()) {
    publisher->set_relay_protocol(kDefaultRelayProtocol);
  }
}

} // namespace relay::config
