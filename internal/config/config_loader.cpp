#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace codereview::config {

using codereview::runtime::config::RuntimeConfig;
using codereview::util::InvalidArgument;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

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
      throw InvalidArgument("unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::Finalize(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw InvalidArgument("configuration root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw InvalidArgument("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw InvalidArgument("invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Finalize(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw InvalidArgument("failed to load YAML config " + path + ": " + e.what());
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw InvalidArgument(std::string("failed to parse YAML config: ") + e.what());
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Finalize(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config->database().backend_case() == codereview::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }
  if (config->database().has_sqlite() && config->database().sqlite().path().empty()) {
    throw InvalidArgument("database.sqlite.path is required");
  }

  if (config->generator().endpoint().empty()) {
    config->mutable_generator()->set_endpoint("localhost:50061");
  }

  if (config->storage().fixed_dir().empty()) {
    config->mutable_storage()->set_fixed_dir("fixed");
  }

  // negative durations are configuration mistakes, not "use the default"
  auto check_duration = [](const google::protobuf::Duration& duration, const char* name) {
    if (duration.seconds() < 0 || duration.nanos() < 0) {
      throw InvalidArgument(std::string(name) + " must not be negative");
    }
  };
  check_duration(config->generator().deadline(), "generator.deadline");
  check_duration(config->subscribers().idle_timeout(), "subscribers.idle_timeout");
  check_duration(config->subscribers().heartbeat_interval(), "subscribers.heartbeat_interval");
  check_duration(config->maintenance().interval(), "maintenance.interval");

  const auto idle_timeout = util::ToMillis(config->subscribers().idle_timeout(), kDefaultIdleTimeout);
  const auto heartbeat    = util::ToMillis(config->subscribers().heartbeat_interval(), kDefaultHeartbeatInterval);
  if (heartbeat >= idle_timeout) {
    throw InvalidArgument("subscribers.heartbeat_interval must be shorter than subscribers.idle_timeout");
  }
}

} // namespace codereview::config
