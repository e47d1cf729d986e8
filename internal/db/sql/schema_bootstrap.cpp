#include "internal/db/sql/schema_bootstrap.hpp"

namespace wfstore::db::sql {

std::string_view ColumnTypeName(Dialect dialect, ColumnType type) {
  const bool pg = dialect == Dialect::kPostgres;
  switch (type) {
    case ColumnType::kInt64:
      return pg ? "BIGINT" : "INTEGER";
    case ColumnType::kText:
      return "TEXT";
    case ColumnType::kBlob:
      return pg ? "BYTEA" : "BLOB";
    case ColumnType::kTimestamp:
      // sqlite keeps the wire value, epoch microseconds
      return pg ? "TIMESTAMP" : "INTEGER";
  }
  return "TEXT";
}

std::vector<std::string> BuildSchemaDdl(const SchemaRegistry& registry, Dialect dialect) {
  std::vector<std::string> ddl;
  ddl.reserve(kMapKindCount);

  for (const auto& schema : registry.All()) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + schema.table_name + " (";
    std::string primary_key;

    for (const auto& column : IdentityColumns()) {
      sql += column.name + " " + std::string(ColumnTypeName(dialect, column.type)) + " NOT NULL, ";
      primary_key += column.name + ", ";
    }
    sql += schema.key.name + " " + std::string(ColumnTypeName(dialect, schema.key.type)) + " NOT NULL, ";
    primary_key += schema.key.name;

    for (const auto& column : schema.value_columns) {
      sql += column.name + " " + std::string(ColumnTypeName(dialect, column.type)) + ", ";
    }

    sql += "PRIMARY KEY (" + primary_key + "));";
    ddl.push_back(std::move(sql));
  }
  return ddl;
}

void BootstrapSchema(MigrationExecutor& executor, const SchemaRegistry& registry, Dialect dialect) {
  RunMigrations(executor, BuildSchemaDdl(registry, dialect));
}

} // namespace wfstore::db::sql
