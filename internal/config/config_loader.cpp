#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace vaultsync::config {

namespace {

using vaultsync::runtime::config::RuntimeConfig;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string scalar_value = node.Scalar();

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

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

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

} // namespace

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

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* sync = config->mutable_sync();
  if (sync->interval_ms() == 0) sync->set_interval_ms(60'000);
  if (sync->poll_interval_ms() == 0) sync->set_poll_interval_ms(200);
  if (sync->max_attempts() == 0) sync->set_max_attempts(5);
  if (sync->backoff_base_ms() == 0) sync->set_backoff_base_ms(500);
  if (sync->backoff_max_ms() == 0) sync->set_backoff_max_ms(30'000);
  if (sync->round_trip_timeout_ms() == 0) sync->set_round_trip_timeout_ms(10'000);
  if (sync->pending_limit() == 0) sync->set_pending_limit(10'000);
  if (sync->max_batch_records() == 0) sync->set_max_batch_records(5'000);
  if (sync->padding_block_bytes() == 0) sync->set_padding_block_bytes(256);

  auto* relay = config->mutable_relay();
  if (relay->mailbox_capacity() == 0) relay->set_mailbox_capacity(1'024);
  if (relay->max_batch_bytes() == 0) relay->set_max_batch_bytes(4 * 1024 * 1024);

  if (config->transport().has_relay()) {
    auto* relay_transport = config->mutable_transport()->mutable_relay();
    if (relay_transport->fetch_max() == 0) relay_transport->set_fetch_max(64);
    if (relay_transport->rpc_timeout_ms() == 0) relay_transport->set_rpc_timeout_ms(5'000);
  }

  if (!config->database().has_sqlite() && !config->database().has_memory()) {
    config->mutable_database()->mutable_memory();
  }
}

} // namespace vaultsync::config
