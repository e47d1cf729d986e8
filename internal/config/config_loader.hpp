#pragma once

#include <string>

#include "config/config.pb.h"

namespace wfstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static wfstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static wfstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  /*
    Throws std::invalid_argument when the database section cannot be served:
      - no backend selected
      - an endpoint list that is empty or has an empty entry
      - num_db_shards not matching the number of endpoints
  */
  static void Validate(const wfstore::runtime::config::RuntimeConfig& config);

  // num_db_shards, or the endpoint count when it is 0.
  static int PhysicalShardCount(const wfstore::runtime::config::DatabaseConfig& database);

  // sqlite or postgres: rows outlive the process that wrote them.
  static bool IsDurable(const wfstore::runtime::config::DatabaseConfig& database);
};

} // namespace wfstore::config
