#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace famgraph::config {

namespace {

constexpr std::uint32_t kDefaultMaxDepth    = 64;
constexpr std::uint32_t kDefaultMaxVisited  = 100000;
constexpr std::uint32_t kDefaultViewDepth   = 2;
constexpr const char*   kDefaultBindAddress = "0.0.0.0:50061";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("2024-01-01", "true")
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

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
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

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  if (config.persistence().mode() == PERSISTENCE_MODE_UNSPECIFIED) {
    config.mutable_persistence()->set_mode(PERSISTENCE_MODE_SYNC);
  }

  auto* traversal = config.mutable_traversal();
  if (traversal->max_depth() == 0) traversal->set_max_depth(kDefaultMaxDepth);
  if (traversal->max_visited() == 0) traversal->set_max_visited(kDefaultMaxVisited);
  if (traversal->default_depth() == 0) traversal->set_default_depth(kDefaultViewDepth);
  if (traversal->default_depth() > traversal->max_depth()) {
    throw std::runtime_error("Invalid configuration: traversal.default_depth exceeds traversal.max_depth");
  }

  if (!config.duplicates().has_compare_birth_date()) {
    config.mutable_duplicates()->set_compare_birth_date(true);
  }
}

} // namespace famgraph::config
