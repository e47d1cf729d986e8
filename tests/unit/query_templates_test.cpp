#include "internal/db/sql/query_templates.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace wfstore::db::sql;

const SchemaRegistry& Registry() {
  static const SchemaRegistry registry = SchemaRegistry::Default();
  return registry;
}

QueryTemplates Build(MapKind kind, Dialect dialect) {
  return BuildQueryTemplates(Registry().Get(kind), dialect);
}

template <typename Fn>
bool ThrowsExpansion(Fn&& fn) {
  try {
    fn();
  } catch (const ParameterExpansionError&) {
    return true;
  }
  return false;
}

void TestPlaceholders() {
  assert(Placeholder(Dialect::kPostgres, 7) == "$7");
  assert(Placeholder(Dialect::kSqlite, 7) == "?7");
  assert(ExpandKeySet(Dialect::kPostgres, 5, 3) == "$5,$6,$7");
  assert(ExpandKeySet(Dialect::kSqlite, 5, 1) == "?5");
  assert(ThrowsExpansion([] { (void)ExpandKeySet(Dialect::kPostgres, 5, 0); }));
}

void TestPostgresActivityUpsert() {
  const auto t = Build(MapKind::kActivityInfo, Dialect::kPostgres);
  assert(t.row_columns.size() == 9);

  const std::string expected =
      "INSERT INTO activity_info_maps (shard_id, domain_id, workflow_id, run_id, schedule_id, data, data_encoding, "
      "last_heartbeat_details, last_heartbeat_updated_time) VALUES "
      "($1, $2, $3, $4, $5, $6, $7, $8, (TIMESTAMP 'epoch' + $9::bigint * INTERVAL '1 microsecond'))"
      " ON CONFLICT (shard_id, domain_id, workflow_id, run_id, schedule_id) DO UPDATE SET data = excluded.data, "
      "data_encoding = excluded.data_encoding, last_heartbeat_details = excluded.last_heartbeat_details, "
      "last_heartbeat_updated_time = excluded.last_heartbeat_updated_time";
  assert(RenderUpsert(t, 1) == expected);
}

void TestSqliteMultiRowUpsert() {
  const auto t   = Build(MapKind::kTimerInfo, Dialect::kSqlite);
  const auto sql = RenderUpsert(t, 2);

  assert(sql.find("VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7), (?8, ?9, ?10, ?11, ?12, ?13, ?14) ON CONFLICT") != std::string::npos);
  assert(sql.find("DO UPDATE SET data = excluded.data, data_encoding = excluded.data_encoding") != std::string::npos);
  // no timestamp column, no conversion
  assert(sql.find("INTERVAL") == std::string::npos);
}

void TestExistenceOnlySetDoesNothingOnConflict() {
  for (auto dialect : {Dialect::kPostgres, Dialect::kSqlite}) {
    const auto t   = Build(MapKind::kSignalsRequested, dialect);
    const auto sql = RenderUpsert(t, 1);
    assert(t.row_columns.size() == 5);
    assert(sql.size() > 10 && sql.substr(sql.size() - 10) == "DO NOTHING");
    assert(sql.find("UPDATE") == std::string::npos);
  }
}

void TestSelectAndDelete() {
  const auto pg = Build(MapKind::kActivityInfo, Dialect::kPostgres);
  assert(pg.select_all ==
         "SELECT schedule_id, data, data_encoding, last_heartbeat_details, "
         "(EXTRACT(EPOCH FROM last_heartbeat_updated_time) * 1000000)::bigint FROM activity_info_maps "
         "WHERE shard_id = $1 AND domain_id = $2 AND workflow_id = $3 AND run_id = $4");
  assert(pg.delete_all == "DELETE FROM activity_info_maps WHERE shard_id = $1 AND domain_id = $2 AND workflow_id = $3 AND run_id = $4");

  const auto timer = Build(MapKind::kTimerInfo, Dialect::kPostgres);
  assert(RenderDeleteByKeys(timer, 3) ==
         "DELETE FROM timer_info_maps WHERE shard_id = $1 AND domain_id = $2 AND workflow_id = $3 AND run_id = $4 "
         "AND timer_id IN ($5,$6,$7)");

  const auto lite = Build(MapKind::kActivityInfo, Dialect::kSqlite);
  assert(lite.select_all ==
         "SELECT schedule_id, data, data_encoding, last_heartbeat_details, last_heartbeat_updated_time FROM activity_info_maps "
         "WHERE shard_id = ?1 AND domain_id = ?2 AND workflow_id = ?3 AND run_id = ?4");

  const auto signals = Build(MapKind::kSignalsRequested, Dialect::kSqlite);
  assert(signals.select_all == "SELECT signal_id FROM signals_requested_sets WHERE shard_id = ?1 AND domain_id = ?2 AND workflow_id = ?3 AND run_id = ?4");
}

void TestParameterLimits() {
  const auto lite_timer = Build(MapKind::kTimerInfo, Dialect::kSqlite);
  // 7 parameters per row
  const std::size_t max_rows = MaxBoundParameters(Dialect::kSqlite) / 7;
  (void)RenderUpsert(lite_timer, max_rows);
  assert(ThrowsExpansion([&] { (void)RenderUpsert(lite_timer, max_rows + 1); }));
  assert(ThrowsExpansion([&] { (void)RenderUpsert(lite_timer, 0); }));

  // identity takes the first 4 placeholders
  (void)RenderDeleteByKeys(lite_timer, MaxBoundParameters(Dialect::kSqlite) - 4);
  assert(ThrowsExpansion([&] { (void)RenderDeleteByKeys(lite_timer, MaxBoundParameters(Dialect::kSqlite) - 3); }));

  const auto pg_timer = Build(MapKind::kTimerInfo, Dialect::kPostgres);
  (void)RenderDeleteByKeys(pg_timer, 65531);
  assert(ThrowsExpansion([&] { (void)RenderDeleteByKeys(pg_timer, 65532); }));
  assert(ThrowsExpansion([&] { (void)RenderDeleteByKeys(pg_timer, 0); }));
}

void TestNoValueSplicedIntoText() {
  const auto t = Build(MapKind::kTimerInfo, Dialect::kPostgres);
  assert(t.upsert_prefix.find('\'') == std::string::npos);
  assert(t.delete_by_keys_prefix.find('\'') == std::string::npos);
  assert(t.select_all.find('\'') == std::string::npos);
}

} // namespace

int main() {
  TestPlaceholders();
  TestPostgresActivityUpsert();
  TestSqliteMultiRowUpsert();
  TestExistenceOnlySetDoesNothingOnConflict();
  TestSelectAndDelete();
  TestParameterLimits();
  TestNoValueSplicedIntoText();

  std::cout << "wfstore_unit_query_templates: pass\n";
  return 0;
}
