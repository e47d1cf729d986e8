#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_execution_store.hpp"
#include "internal/db/sql/schema_bootstrap.hpp"
#include "internal/db/sql/sql_execution_store.hpp"
#include "internal/observability/logging.hpp"
#if WFSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_executor.hpp"
#endif
#if WFSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_executor.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace wfstore::factory {

namespace {

void BootstrapShards(const StoreRuntime& runtime) {
  for (std::size_t i = 0; i < runtime.shards.size(); ++i) {
    db::sql::BootstrapSchema(*runtime.shards[i], *runtime.registry, *runtime.dialect);
    WFSTORE_LOG_INFO("schema ready", {observability::StringField("dialect", db::sql::DialectName(*runtime.dialect)),
                                      observability::IntField("shard", static_cast<std::int64_t>(i))});
  }
}

#if WFSTORE_DB_SQLITE
std::vector<std::shared_ptr<db::sql::Executor>> OpenSqliteShards(const wfstore::runtime::config::SqliteConfig& sqlite) {
  db::sqlite::SqliteOptions options;
  if (sqlite.busy_timeout_ms() > 0) {
    options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
  }
  options.wal_mode = sqlite.wal_mode();

  std::vector<std::shared_ptr<db::sql::Executor>> shards;
  for (const auto& path : sqlite.paths()) {
    auto handle = std::make_shared<db::sqlite::SqliteDB>(path, options);
    shards.push_back(std::make_shared<db::sqlite::SqliteExecutor>(std::move(handle)));
  }
  return shards;
}
#endif

#if WFSTORE_DB_POSTGRES
std::vector<std::shared_ptr<db::sql::Executor>> OpenPostgresShards(const wfstore::runtime::config::PostgresConfig& postgres) {
  const std::size_t max_connections = postgres.max_connections_per_shard() > 0 ? postgres.max_connections_per_shard() : 16;

  std::vector<std::shared_ptr<db::sql::Executor>> shards;
  for (const auto& uri : postgres.connection_uris()) {
    auto pool = std::make_shared<db::postgres::PgPool>(uri, max_connections);
    shards.push_back(std::make_shared<db::postgres::PgExecutor>(std::move(pool)));
  }
  return shards;
}
#endif

} // namespace

StoreRuntime BuildStore(const wfstore::runtime::config::RuntimeConfig& config, bool bootstrap_schema) {
  config::ConfigLoader::Validate(config);

  StoreRuntime runtime;
  runtime.registry = std::make_shared<const db::sql::SchemaRegistry>(db::sql::SchemaRegistry::Default());

  const auto& database = config.database();
  const int   total    = config::ConfigLoader::PhysicalShardCount(database);

  if (database.has_sqlite()) {
#if WFSTORE_DB_SQLITE
    runtime.dialect = db::sql::Dialect::kSqlite;
    runtime.shards  = OpenSqliteShards(database.sqlite());
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else if (database.has_postgres()) {
#if WFSTORE_DB_POSTGRES
    runtime.dialect = db::sql::Dialect::kPostgres;
    runtime.shards  = OpenPostgresShards(database.postgres());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (runtime.dialect.has_value()) {
    if (bootstrap_schema) {
      BootstrapShards(runtime);
    }
    runtime.store = std::make_shared<db::sql::SqlExecutionStore>(*runtime.dialect, runtime.registry, runtime.shards);
  } else {
    runtime.store = std::make_shared<db::memory::MemoryExecutionStore>(runtime.registry, total);
  }

  WFSTORE_LOG_INFO("execution store ready",
                   {observability::StringField("backend", runtime.dialect ? db::sql::DialectName(*runtime.dialect) : "memory"),
                    observability::IntField("physical_shards", runtime.store->TotalPhysicalShards())});
  return runtime;
}

} // namespace wfstore::factory
