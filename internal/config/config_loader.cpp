#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace wfstore::config {

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

static wfstore::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  wfstore::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

template <typename Endpoints>
static void ValidateEndpoints(const Endpoints& endpoints, const char* backend) {
  if (endpoints.empty()) {
    throw std::invalid_argument(std::string(backend) + ": at least one endpoint is required");
  }
  for (int i = 0; i < endpoints.size(); ++i) {
    if (endpoints.Get(i).empty()) {
      throw std::invalid_argument(std::string(backend) + ": endpoint " + std::to_string(i) + " is empty");
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

wfstore::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

wfstore::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const wfstore::runtime::config::RuntimeConfig& config) {
  using wfstore::runtime::config::DatabaseConfig;

  const auto& database = config.database();
  int         endpoints = 0;

  switch (database.backend_case()) {
    case DatabaseConfig::kSqlite:
      ValidateEndpoints(database.sqlite().paths(), "sqlite");
      endpoints = database.sqlite().paths_size();
      break;

    case DatabaseConfig::kPostgres:
      ValidateEndpoints(database.postgres().connection_uris(), "postgres");
      endpoints = database.postgres().connection_uris_size();
      break;

    case DatabaseConfig::kMemory:
      // memory has no endpoints; it is partitioned in-process
      if (database.num_db_shards() == 0) {
        throw std::invalid_argument("memory: num_db_shards must be > 0");
      }
      return;

    case DatabaseConfig::BACKEND_NOT_SET:
      throw std::invalid_argument("database: no backend selected (sqlite, postgres or memory)");
  }

  if (database.num_db_shards() != 0 && static_cast<int>(database.num_db_shards()) != endpoints) {
    throw std::invalid_argument("database: num_db_shards=" + std::to_string(database.num_db_shards()) + " but " +
                                std::to_string(endpoints) + " endpoints are configured");
  }
}

int ConfigLoader::PhysicalShardCount(const wfstore::runtime::config::DatabaseConfig& database) {
  if (database.num_db_shards() > 0) {
    return static_cast<int>(database.num_db_shards());
  }
  if (database.has_sqlite()) {
    return database.sqlite().paths_size();
  }
  if (database.has_postgres()) {
    return database.postgres().connection_uris_size();
  }
  return 0;
}

bool ConfigLoader::IsDurable(const wfstore::runtime::config::DatabaseConfig& database) {
  return database.has_sqlite() || database.has_postgres();
}

} // namespace wfstore::config
