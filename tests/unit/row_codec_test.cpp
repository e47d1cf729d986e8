#include "internal/db/sql/row_codec.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace wfstore::db::sql;
using wfstore::db::model::ActivityInfoMapsRow;
using wfstore::db::model::ExecutionIdentity;
using wfstore::db::model::SignalsRequestedSetsRow;
using wfstore::db::model::TimerInfoMapsRow;
using wfstore::db::model::TimePoint;

// One result column; nullptr_t marks NULL.
using Cell  = std::variant<std::nullptr_t, int64_t, std::string, Blob>;
using Cells = std::vector<Cell>;

Cells FromParams(const Params& params) {
  Cells cells;
  for (const auto& param : params) {
    std::visit([&](const auto& v) { cells.emplace_back(v); }, param);
  }
  return cells;
}

class FakeRow final : public Row {
 public:
  explicit FakeRow(Cells values) : values_(std::move(values)) {
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

Blob Bytes(const std::string& s) {
  return Blob(s.begin(), s.end());
}

ExecutionIdentity Execution() {
  return ExecutionIdentity{.shard_id = 9, .domain_id = "d", .workflow_id = "w", .run_id = "r"};
}

void TestTimestampsFloorToMicroseconds() {
  const TimePoint epoch{};
  assert(ToEpochMicros(epoch) == 0);
  assert(ToEpochMicros(epoch + std::chrono::nanoseconds(1999)) == 1);
  // floor, not truncation toward zero
  assert(ToEpochMicros(epoch - std::chrono::nanoseconds(1)) == -1);

  const auto tp = epoch + std::chrono::microseconds(1'700'000'000'123'456LL) + std::chrono::nanoseconds(789);
  assert(NormalizeTimestamp(tp) == epoch + std::chrono::microseconds(1'700'000'000'123'456LL));
  assert(FromEpochMicros(ToEpochMicros(tp)) == NormalizeTimestamp(tp));
  assert(NormalizeTimestamp(NormalizeTimestamp(tp)) == NormalizeTimestamp(tp));
}

void TestIdentityEncoding() {
  Params params;
  EncodeIdentity(Execution(), params);
  assert(params.size() == 4);
  assert(std::get<int64_t>(params[0]) == 9);
  assert(std::get<std::string>(params[1]) == "d");
  assert(std::get<std::string>(params[2]) == "w");
  assert(std::get<std::string>(params[3]) == "r");
}

void TestActivityEncodeDecode() {
  ActivityInfoMapsRow row;
  row.execution                   = Execution();
  row.schedule_id                 = 42;
  row.data                        = Bytes("payload");
  row.data_encoding               = "thriftrw";
  row.last_heartbeat_details      = Bytes("hb");
  row.last_heartbeat_updated_time = TimePoint{} + std::chrono::microseconds(1234567) + std::chrono::nanoseconds(999);

  Params params;
  MapCodec<ActivityInfoMapsRow>::Encode(row, params);
  assert(params.size() == SchemaRegistry::Default().Get(MapKind::kActivityInfo).value_columns.size() + 1);
  assert(std::get<int64_t>(params[0]) == 42);
  assert(std::get<Blob>(params[1]) == Bytes("payload"));
  assert(std::get<std::string>(params[2]) == "thriftrw");
  assert(std::get<Blob>(params[3]) == Bytes("hb"));
  assert(std::get<int64_t>(params[4]) == 1234567);

  auto decoded = MapCodec<ActivityInfoMapsRow>::Decode(FakeRow(FromParams(params)));
  // identity is stamped by the store, not the codec
  assert(decoded.execution == ExecutionIdentity{});
  decoded.execution = row.execution;

  auto expected = row;
  MapCodec<ActivityInfoMapsRow>::Normalize(expected);
  assert(decoded == expected);
}

void TestNullColumnsDecodeToEmptyValues() {
  FakeRow row(Cells{std::string("timer-1"), nullptr, nullptr});
  auto    decoded = MapCodec<TimerInfoMapsRow>::Decode(row);
  assert(decoded.timer_id == "timer-1");
  assert(decoded.data.empty());
  assert(decoded.data_encoding.empty());

  FakeRow activity(Cells{int64_t{1}, nullptr, nullptr, nullptr, nullptr});
  auto    decoded_activity = MapCodec<ActivityInfoMapsRow>::Decode(activity);
  assert(decoded_activity.last_heartbeat_updated_time == TimePoint{});
}

void TestExistenceOnlyEncodesKey() {
  SignalsRequestedSetsRow row{.execution = Execution(), .signal_id = "sig"};
  Params                  params;
  MapCodec<SignalsRequestedSetsRow>::Encode(row, params);
  assert(params.size() == 1);
  assert(std::get<std::string>(params[0]) == "sig");
}

void TestDecodeTypeMismatchThrows() {
  FakeRow row(Cells{std::string("not-an-int"), nullptr, nullptr});
  bool    threw = false;
  try {
    (void)MapCodec<wfstore::db::model::SignalInfoMapsRow>::Decode(row);
  } catch (const std::bad_variant_access&) {
    threw = true;
  }
  assert(threw);
}

void TestCollapseDuplicateKeys() {
  auto make = [](const std::string& timer, const std::string& data) {
    return TimerInfoMapsRow{.execution = Execution(), .timer_id = timer, .data = Bytes(data), .data_encoding = "json"};
  };

  std::vector<TimerInfoMapsRow> rows = {make("a", "1"), make("b", "1"), make("a", "2"), make("c", "1"), make("a", "3")};
  auto                          batch = CollapseDuplicateKeys(rows);

  assert(batch.size() == 3);
  assert(batch[0] == &rows[4]);
  assert(batch[1] == &rows[1]);
  assert(batch[2] == &rows[3]);

  // same key, different execution: both kept
  auto other             = make("a", "x");
  other.execution.run_id = "r2";
  rows.push_back(other);
  assert(CollapseDuplicateKeys(rows).size() == 4);

  assert(CollapseDuplicateKeys(std::vector<TimerInfoMapsRow>{}).empty());
}

} // namespace

int main() {
  TestTimestampsFloorToMicroseconds();
  TestIdentityEncoding();
  TestActivityEncodeDecode();
  TestNullColumnsDecodeToEmptyValues();
  TestExistenceOnlyEncodesKey();
  TestDecodeTypeMismatchThrows();
  TestCollapseDuplicateKeys();

  std::cout << "wfstore_unit_row_codec: pass\n";
  return 0;
}
