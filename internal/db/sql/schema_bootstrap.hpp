#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/query_templates.hpp"
#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::db::sql {

// Storage type of a column in the dialect: BIGINT / INTEGER, BYTEA / BLOB, ...
std::string_view ColumnTypeName(Dialect dialect, ColumnType type);

// One CREATE TABLE IF NOT EXISTS per map table, in MapKind order.
std::vector<std::string> BuildSchemaDdl(const SchemaRegistry& registry, Dialect dialect);

/*
  Creates every map table on one physical shard. Idempotent.
  Throws std::runtime_error naming the failing step.
*/
void BootstrapSchema(MigrationExecutor& executor, const SchemaRegistry& registry, Dialect dialect);

} // namespace wfstore::db::sql
