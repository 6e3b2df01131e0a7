#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace releaselog::config {

using releaselog::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
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
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    return ConfigLoader::WithDefaults(std::move(config));
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

  return ConfigLoader::WithDefaults(std::move(config));
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

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::WithDefaults(RuntimeConfig config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* cluster = config.mutable_cluster();
  if (cluster->request_timeout_ms() == 0) cluster->set_request_timeout_ms(10000);

  auto* release_api = cluster->mutable_release_api();
  if (release_api->group().empty()) release_api->set_group("kuberik.com");
  if (release_api->version().empty()) release_api->set_version("v1alpha1");
  if (release_api->resource().empty()) release_api->set_resource("rollouts");

  auto* test_api = cluster->mutable_release_test_api();
  if (test_api->group().empty()) test_api->set_group("kuberik.com");
  if (test_api->version().empty()) test_api->set_version("v1alpha1");
  if (test_api->resource().empty()) test_api->set_resource("rollouttests");

  auto* engine = config.mutable_engine();
  if (engine->discovery_interval_ms() == 0) engine->set_discovery_interval_ms(5000);
  if (engine->pod_poll_interval_ms() == 0) engine->set_pod_poll_interval_ms(2000);
  if (engine->snapshot_interval_ms() == 0) engine->set_snapshot_interval_ms(2000);
  if (engine->keepalive_interval_ms() == 0) engine->set_keepalive_interval_ms(15000);
  if (engine->channel_capacity() == 0) engine->set_channel_capacity(1000);
  if (engine->initial_tail_lines() == 0) engine->set_initial_tail_lines(500);
  if (engine->shutdown_timeout_ms() == 0) engine->set_shutdown_timeout_ms(5000);
  if (engine->idle_warning_ms() == 0) engine->set_idle_warning_ms(60000);

  auto* observability = config.mutable_observability();
  if (observability->collection_interval_ms() == 0) observability->set_collection_interval_ms(1000);

  return config;
}

} // namespace releaselog::config
