#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/execution_maps.hpp"
#include "internal/db/api/context.hpp"
#include "internal/db/sharding/shard_router.hpp"
#include "internal/db/sql/query_templates.hpp"
#include "internal/db/sql/schema_bootstrap.hpp"
#include "internal/db/sql/schema_registry.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using wfstore::db::Context;
using wfstore::db::sql::Dialect;

namespace {

constexpr auto kCommandTimeout = std::chrono::seconds(30);

void Usage() {
  std::cout << "Usage:\n"
            << "  wfstorectl <config.yaml> bootstrap\n"
            << "  wfstorectl <config.yaml> route <logical_shard_id>\n"
            << "  wfstorectl <config.yaml> templates <kind> [postgres|sqlite]\n"
            << "  wfstorectl <config.yaml> dump <shard_id> <domain_id> <workflow_id> <run_id>\n"
            << "  wfstorectl <config.yaml> purge <shard_id> <domain_id> <workflow_id> <run_id>\n"
            << "\n"
            << "kinds: activity_info timer_info child_execution_info request_cancel_info signal_info signals_requested\n";
}

std::optional<Dialect> ParseDialect(const std::string& value) {
  if (value == "postgres") {
    return Dialect::kPostgres;
  }
  if (value == "sqlite") {
    return Dialect::kSqlite;
  }
  return std::nullopt;
}

Dialect ConfiguredDialect(const wfstore::runtime::config::RuntimeConfig& config) {
  return config.database().has_sqlite() ? Dialect::kSqlite : Dialect::kPostgres;
}

wfstore::db::model::ExecutionIdentity ParseExecution(char** argv) {
  wfstore::db::model::ExecutionIdentity execution;
  execution.shard_id    = std::stoll(argv[0]);
  execution.domain_id   = argv[1];
  execution.workflow_id = argv[2];
  execution.run_id      = argv[3];
  return execution;
}

void PrintTemplates(const wfstore::db::sql::QueryTemplates& t) {
  std::cout << "-- " << wfstore::db::sql::MapKindName(t.kind) << " (" << wfstore::db::sql::DialectName(t.dialect) << ")\n"
            << "upsert[1]:      " << wfstore::db::sql::RenderUpsert(t, 1) << "\n"
            << "select_all:     " << t.select_all << "\n"
            << "delete_keys[2]: " << wfstore::db::sql::RenderDeleteByKeys(t, 2) << "\n"
            << "delete_all:     " << t.delete_all << "\n";
}

// dump and purge read or delete rows written by other processes
bool RequireDurableStore(const std::string& cmd, const wfstore::runtime::config::RuntimeConfig& config) {
  if (wfstore::config::ConfigLoader::IsDurable(config.database())) {
    return true;
  }
  std::cerr << cmd << " needs a sqlite or postgres database; a memory store starts empty\n";
  return false;
}

void Shutdown() {
  wfstore::observability::ShutdownLogging();
  wfstore::observability::ShutdownMetrics();
  wfstore::observability::ShutdownTracing();
}

int Run(int argc, char** argv) {
  const std::string cmd    = argv[2];
  auto              config = wfstore::config::ConfigLoader::LoadFromYaml(argv[1]);

  wfstore::observability::InitializeTracing(config);
  wfstore::observability::InitializeMetrics(config);
  wfstore::observability::InitializeLogging(config);

  // ------------------------------------------------------------

  if (cmd == "bootstrap") {
    auto runtime = wfstore::factory::BuildStore(config, true);
    std::cout << "bootstrapped " << runtime.store->TotalPhysicalShards() << " shard(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "route") {
    if (argc < 4) return 1;

    wfstore::config::ConfigLoader::Validate(config);
    const auto total    = wfstore::config::ConfigLoader::PhysicalShardCount(config.database());
    const auto logical  = std::stoll(argv[3]);
    const auto physical = wfstore::db::sharding::ResolvePhysicalShard(logical, total);

    std::cout << "logical=" << logical << " physical=" << physical << " total=" << total << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "templates") {
    if (argc < 4) return 1;

    auto kind = wfstore::db::sql::ParseMapKind(argv[3]);
    if (!kind.has_value()) {
      std::cerr << "unknown kind: " << argv[3] << "\n";
      return 1;
    }

    auto dialect = ConfiguredDialect(config);
    if (argc >= 5) {
      auto parsed = ParseDialect(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported dialect: " << argv[4] << "\n";
        return 1;
      }
      dialect = *parsed;
    }

    const auto registry = wfstore::db::sql::SchemaRegistry::Default();
    PrintTemplates(wfstore::db::sql::BuildQueryTemplates(registry.Get(*kind), dialect));

    // BuildSchemaDdl is in MapKind order
    const auto ddl = wfstore::db::sql::BuildSchemaDdl(registry, dialect);
    std::cout << "ddl:            " << ddl[static_cast<std::size_t>(*kind)] << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dump") {
    if (argc < 7) return 1;
    if (!RequireDurableStore(cmd, config)) return 1;

    auto execution = ParseExecution(argv + 3);
    auto runtime   = wfstore::factory::BuildStore(config, false);

    wfstore::core::MapItemCounts counts{};
    auto r = wfstore::core::CountExecutionMaps(*runtime.store, Context::WithTimeout(kCommandTimeout), execution, counts);
    if (!r) {
      std::cerr << wfstore::db::ErrorCodeName(r.code) << ": " << r.message << "\n";
      return 2;
    }

    for (auto kind : wfstore::db::sql::kAllMapKinds) {
      std::cout << runtime.registry->Get(kind).table_name << "=" << counts[static_cast<std::size_t>(kind)] << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purge") {
    if (argc < 7) return 1;
    if (!RequireDurableStore(cmd, config)) return 1;

    auto execution = ParseExecution(argv + 3);
    auto runtime   = wfstore::factory::BuildStore(config, false);

    auto r = wfstore::core::PurgeExecutionMaps(*runtime.store, Context::WithTimeout(kCommandTimeout), execution);
    if (!r) {
      std::cerr << wfstore::db::ErrorCodeName(r.code) << ": " << r.message << "\n";
      return 2;
    }

    std::cout << "purged rows=" << r.rows_affected << "\n";
    return 0;
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    rc = Run(argc, argv);
  } catch (const std::exception& e) {
    WFSTORE_LOG_ERROR("Fatal error", {wfstore::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  Shutdown();
  return rc;
}
