#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace jobflow::config {

using jobflow::runtime::config::RuntimeConfig;
using jobflow::runtime::config::StoreConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("0755", "true")
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

static RuntimeConfig ParseNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // an empty document means all defaults
  if (!yaml.IsDefined() || yaml.IsNull()) {
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

  ConfigLoader::Validate(config);
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

  auto config = ParseNode(yaml);
  ResolveRelativePaths(config, std::filesystem::absolute(path).parent_path());
  return config;
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

void ConfigLoader::ResolveRelativePaths(RuntimeConfig& config, const std::filesystem::path& base_dir) {
  auto resolve = [&](std::string* path) {
    if (path->empty() || std::filesystem::path(*path).is_absolute()) return;
    *path = (base_dir / *path).lexically_normal().string();
  };

  auto* store = config.mutable_store();
  if (store->has_json()) resolve(store->mutable_json()->mutable_path());
  if (store->has_sqlite()) resolve(store->mutable_sqlite()->mutable_path());
  resolve(config.mutable_content()->mutable_root_path());
  resolve(config.mutable_logging()->mutable_file_path());
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};
  if (const auto& level = config.logging().level(); !level.empty() && !kLevels.contains(level)) {
    throw std::invalid_argument("logging.level '" + level + "' is not a log level");
  }

  if (config.content().array_chunk_length() < 0) {
    throw std::invalid_argument("content.array_chunk_length must not be negative");
  }

  const auto& store = config.store();
  switch (store.backend_case()) {
    case StoreConfig::kJson:
      if (store.json().path().empty()) {
        throw std::invalid_argument("store.json.path is required");
      }
      break;
    case StoreConfig::kSqlite:
      if (store.sqlite().path().empty()) {
        throw std::invalid_argument("store.sqlite.path is required");
      }
      break;
    case StoreConfig::kMemory:
    case StoreConfig::BACKEND_NOT_SET:
      break;
  }
}

} // namespace jobflow::config
