#include "internal/db/sql/sql_execution_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace wfstore::db;
using namespace wfstore::db::sql;
using model::ActivityInfoMapsFilter;
using model::ActivityInfoMapsRow;
using model::ExecutionIdentity;
using model::SignalsRequestedSetsFilter;
using model::TimerInfoMapsFilter;
using model::TimerInfoMapsRow;

struct Call {
  std::string sql;
  Params      params;
};

// One result column; nullptr_t marks NULL.
using Cell  = std::variant<std::nullptr_t, int64_t, std::string, Blob>;
using Cells = std::vector<Cell>;

class ValueRow final : public Row {
 public:
  explicit ValueRow(Cells values) : values_(std::move(values)) {
  }
  std::string GetText(int col) const override {
    return std::get<std::string>(values_.at(col));
  }
  int64_t GetInt64(int col) const override {
    return std::get<int64_t>(values_.at(col));
  }
  Blob GetBlob(int col) const override {
    return std::get<Blob>(values_.at(col));
  }
  bool IsNull(int col) const override {
    return std::holds_alternative<std::nullptr_t>(values_.at(col));
  }

 private:
  Cells values_;
};

// Records every statement and answers with a canned result.
class RecordingExecutor final : public Executor {
 public:
  Result Exec(const Context&, const std::string& sql, const Params& params) override {
    std::lock_guard lock(mutex_);
    calls.push_back({sql, params});
    return next_result;
  }

  Result Query(const Context&, const std::string& sql, const Params& params, const RowCallback& on_row) override {
    std::lock_guard lock(mutex_);
    calls.push_back({sql, params});
    if (!next_result) {
      return next_result;
    }
    for (const auto& row : rows) {
      on_row(ValueRow(row));
    }
    return Result::Ok();
  }

  std::size_t ParameterLimit() override {
    return parameter_limit;
  }

  void ExecuteSQL(const std::string& sql) override {
    calls.push_back({sql, {}});
  }

  std::vector<Call>   calls;
  std::vector<Cells>  rows;
  Result              next_result     = Result::Ok(1);
  std::size_t         parameter_limit = MaxBoundParameters(Dialect::kPostgres);

 private:
  std::mutex mutex_;
};

struct Fixture {
  std::vector<std::shared_ptr<RecordingExecutor>> shards;
  std::unique_ptr<SqlExecutionStore>              store;
};

Fixture MakeFixture(Dialect dialect, int physical_shards) {
  Fixture                                f;
  std::vector<std::shared_ptr<Executor>> executors;
  for (int i = 0; i < physical_shards; ++i) {
    f.shards.push_back(std::make_shared<RecordingExecutor>());
    executors.push_back(f.shards.back());
  }
  f.store = std::make_unique<SqlExecutionStore>(dialect, std::make_shared<const SchemaRegistry>(SchemaRegistry::Default()),
                                                std::move(executors));
  return f;
}

ExecutionIdentity Execution(std::int64_t shard) {
  return ExecutionIdentity{.shard_id = shard, .domain_id = "domain", .workflow_id = "workflow", .run_id = "run"};
}

TimerInfoMapsRow Timer(std::int64_t shard, const std::string& id, const std::string& data) {
  return TimerInfoMapsRow{.execution = Execution(shard), .timer_id = id, .data = Blob(data.begin(), data.end()), .data_encoding = "json"};
}

std::size_t TotalCalls(const Fixture& f) {
  std::size_t total = 0;
  for (const auto& shard : f.shards) {
    total += shard->calls.size();
  }
  return total;
}

void TestConstructorValidatesShards() {
  auto registry = std::make_shared<const SchemaRegistry>(SchemaRegistry::Default());

  bool threw = false;
  try {
    SqlExecutionStore store(Dialect::kSqlite, registry, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SqlExecutionStore store(Dialect::kSqlite, registry, {std::make_shared<RecordingExecutor>(), nullptr});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestReplaceRoutesAndBinds() {
  auto f = MakeFixture(Dialect::kPostgres, 4);

  auto r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(6, "a", "1"), Timer(6, "b", "1"), Timer(6, "a", "2")});
  assert(r);

  // logical 6 -> physical 2
  assert(f.shards[2]->calls.size() == 1);
  assert(TotalCalls(f) == 1);

  const auto& call = f.shards[2]->calls[0];
  assert(call.sql == RenderUpsert(f.store->Templates(MapKind::kTimerInfo), 2));
  assert(call.params.size() == 14);
  assert(std::get<int64_t>(call.params[0]) == 6);
  assert(std::get<std::string>(call.params[4]) == "a");
  // last occurrence of "a" wins
  assert(std::get<Blob>(call.params[5]) == Blob{'2'});
  assert(std::get<std::string>(call.params[11]) == "b");
}

void TestNoOpsNeverReachTheBackend() {
  auto f = MakeFixture(Dialect::kSqlite, 2);

  auto r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {});
  assert(r);
  assert(r.rows_affected == 0);

  r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(1), .keys = std::vector<std::string>{}});
  assert(r);
  assert(r.rows_affected == 0);

  // even a negative shard id is fine when there is nothing to do
  r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(-1), .keys = std::vector<std::string>{}});
  assert(r);

  assert(TotalCalls(f) == 0);
}

void TestDeleteStatements() {
  auto f = MakeFixture(Dialect::kSqlite, 2);

  auto r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(3), .keys = std::nullopt});
  assert(r);
  assert(f.shards[1]->calls.back().sql == f.store->Templates(MapKind::kTimerInfo).delete_all);
  assert(f.shards[1]->calls.back().params.size() == 4);

  r = f.store->DeleteFromTimerInfoMaps(Context::Background(),
                                       TimerInfoMapsFilter{.execution = Execution(3), .keys = std::vector<std::string>{"x", "y"}});
  assert(r);
  const auto& call = f.shards[1]->calls.back();
  assert(call.sql == RenderDeleteByKeys(f.store->Templates(MapKind::kTimerInfo), 2));
  assert(call.params.size() == 6);
  assert(std::get<std::string>(call.params[5]) == "y");
}

void TestSelectStampsIdentity() {
  auto f = MakeFixture(Dialect::kSqlite, 1);
  f.shards[0]->rows = {Cells{std::string("t1"), Blob{'a'}, std::string("json")}, Cells{std::string("t2"), nullptr, nullptr}};

  std::vector<TimerInfoMapsRow> out;
  auto r = f.store->SelectFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(5), .keys = std::nullopt}, out);
  assert(r);
  assert(r.rows_affected == 2);
  assert(out.size() == 2);
  assert(out[0].execution == Execution(5));
  assert(out[1].timer_id == "t2");
  assert(out[1].data.empty());
}

void TestFailuresPropagate() {
  auto f = MakeFixture(Dialect::kSqlite, 1);
  f.shards[0]->next_result = Result::Err(ErrorCode::Busy, "database is locked");

  auto r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(0, "a", "1")});
  assert(r.code == ErrorCode::Busy);
  assert(r.message == "database is locked");

  // out untouched on failure
  std::vector<TimerInfoMapsRow> out = {Timer(0, "keep", "")};
  r = f.store->SelectFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(0), .keys = std::nullopt}, out);
  assert(r.code == ErrorCode::Busy);
  assert(out.size() == 1 && out[0].timer_id == "keep");
}

void TestInvalidBatchesAreRejected() {
  auto f = MakeFixture(Dialect::kPostgres, 2);

  auto r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(0, "a", "1"), Timer(1, "b", "1")});
  assert(r.code == ErrorCode::InvalidArgument);

  // different logical shards on one physical shard are fine
  r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(0, "a", "1"), Timer(2, "b", "1")});
  assert(r);

  r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), {Timer(-4, "a", "1")});
  assert(r.code == ErrorCode::InvalidArgument);

  std::vector<std::string> keys(MaxBoundParameters(Dialect::kPostgres), "k");
  r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(0), .keys = keys});
  assert(r.code == ErrorCode::ParameterExpansion);

  assert(TotalCalls(f) == 1);
}

// the connection may accept fewer parameters than the dialect allows
void TestShardParameterLimitIsHonoured() {
  auto f = MakeFixture(Dialect::kSqlite, 1);
  f.shards[0]->parameter_limit = 999;

  // identity binds 4 of them
  std::vector<std::string> keys;
  for (int i = 0; i < 995; ++i) {
    keys.push_back("k" + std::to_string(i));
  }
  auto r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(0), .keys = keys});
  assert(r);

  keys.push_back("k995");
  r = f.store->DeleteFromTimerInfoMaps(Context::Background(), TimerInfoMapsFilter{.execution = Execution(0), .keys = keys});
  assert(r.code == ErrorCode::ParameterExpansion);
  assert(r.message.find("999") != std::string::npos);

  // a timer row binds 7
  std::vector<TimerInfoMapsRow> rows;
  for (int i = 0; i < 999 / 7; ++i) {
    rows.push_back(Timer(0, "t" + std::to_string(i), "x"));
  }
  assert(f.store->ReplaceIntoTimerInfoMaps(Context::Background(), rows));

  rows.push_back(Timer(0, "overflow", "x"));
  r = f.store->ReplaceIntoTimerInfoMaps(Context::Background(), rows);
  assert(r.code == ErrorCode::ParameterExpansion);

  assert(TotalCalls(f) == 2);
}

} // namespace

int main() {
  TestConstructorValidatesShards();
  TestReplaceRoutesAndBinds();
  TestNoOpsNeverReachTheBackend();
  TestDeleteStatements();
  TestSelectStampsIdentity();
  TestFailuresPropagate();
  TestInvalidBatchesAreRejected();
  TestShardParameterLimitIsHonoured();

  std::cout << "wfstore_unit_sql_execution_store: pass\n";
  return 0;
}
