#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/execution_store.hpp"
#include "internal/db/sql/executor.hpp"
#include "internal/db/sql/query_templates.hpp"
#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::factory {

/*
  StoreRuntime

  Everything one ExecutionStore needs for the lifetime of the process.
  shards is empty and dialect unset for the memory backend.
*/
struct StoreRuntime {
  std::shared_ptr<const db::sql::SchemaRegistry>  registry;
  std::shared_ptr<db::ExecutionStore>             store;
  std::vector<std::shared_ptr<db::sql::Executor>> shards;
  std::optional<db::sql::Dialect>                 dialect;
};

/*
  BuildStore

  Validates the config, opens one connection (sqlite) or pool (postgres) per
  physical shard and, when bootstrap_schema is set, creates the map tables
  on each of them.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete DB types. Throws on invalid config or unreachable shards.
*/
StoreRuntime BuildStore(const wfstore::runtime::config::RuntimeConfig& config, bool bootstrap_schema);

} // namespace wfstore::factory
