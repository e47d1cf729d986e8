#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "internal/db/model/activity_info_row.hpp"
#include "internal/db/model/child_execution_info_row.hpp"
#include "internal/db/model/request_cancel_info_row.hpp"
#include "internal/db/model/signal_info_row.hpp"
#include "internal/db/model/signals_requested_row.hpp"
#include "internal/db/model/timer_info_row.hpp"
#include "internal/db/sql/schema_registry.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace wfstore::db::sql {

// ------------------------------------------------------------------
// Timestamps
//
// In memory: system_clock::time_point. On the wire: int64 microseconds since
// the unix epoch, the finest precision both backends keep. Normalize() is
// what a value looks like after a round trip through storage.
// ------------------------------------------------------------------

std::int64_t     ToEpochMicros(model::TimePoint tp);
model::TimePoint FromEpochMicros(std::int64_t micros);
model::TimePoint NormalizeTimestamp(model::TimePoint tp);

// Appends shard_id, domain_id, workflow_id, run_id.
void EncodeIdentity(const model::ExecutionIdentity& execution, Params& out);

/*
  MapCodec<Record>

  Binds one record type to its MapKind and converts it to / from the column
  order of its MapSchema:

    Encode: key, value columns...   (identity is encoded by EncodeIdentity)
    Decode: reads the select-all columns: key at 0, then value columns.
            Identity is left empty; the store stamps it from the filter.
*/
template <typename RecordT>
struct MapCodec;

template <>
struct MapCodec<model::ActivityInfoMapsRow> {
  using Record = model::ActivityInfoMapsRow;
  using Key    = std::int64_t;
  using Filter = model::ActivityInfoMapsFilter;

  static constexpr MapKind          kKind = MapKind::kActivityInfo;
  static constexpr std::string_view kName = "ActivityInfoMaps";

  static const Key& KeyOf(const Record& r) {
    return r.schedule_id;
  }
  static void   Normalize(Record& r);
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

template <>
struct MapCodec<model::TimerInfoMapsRow> {
  using Record = model::TimerInfoMapsRow;
  using Key    = std::string;
  using Filter = model::TimerInfoMapsFilter;

  static constexpr MapKind          kKind = MapKind::kTimerInfo;
  static constexpr std::string_view kName = "TimerInfoMaps";

  static const Key& KeyOf(const Record& r) {
    return r.timer_id;
  }
  static void   Normalize(Record&) {}
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

template <>
struct MapCodec<model::ChildExecutionInfoMapsRow> {
  using Record = model::ChildExecutionInfoMapsRow;
  using Key    = std::int64_t;
  using Filter = model::ChildExecutionInfoMapsFilter;

  static constexpr MapKind          kKind = MapKind::kChildExecutionInfo;
  static constexpr std::string_view kName = "ChildExecutionInfoMaps";

  static const Key& KeyOf(const Record& r) {
    return r.initiated_id;
  }
  static void   Normalize(Record&) {}
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

template <>
struct MapCodec<model::RequestCancelInfoMapsRow> {
  using Record = model::RequestCancelInfoMapsRow;
  using Key    = std::int64_t;
  using Filter = model::RequestCancelInfoMapsFilter;

  static constexpr MapKind          kKind = MapKind::kRequestCancelInfo;
  static constexpr std::string_view kName = "RequestCancelInfoMaps";

  static const Key& KeyOf(const Record& r) {
    return r.initiated_id;
  }
  static void   Normalize(Record&) {}
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

template <>
struct MapCodec<model::SignalInfoMapsRow> {
  using Record = model::SignalInfoMapsRow;
  using Key    = std::int64_t;
  using Filter = model::SignalInfoMapsFilter;

  static constexpr MapKind          kKind = MapKind::kSignalInfo;
  static constexpr std::string_view kName = "SignalInfoMaps";

  static const Key& KeyOf(const Record& r) {
    return r.initiated_id;
  }
  static void   Normalize(Record&) {}
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

template <>
struct MapCodec<model::SignalsRequestedSetsRow> {
  using Record = model::SignalsRequestedSetsRow;
  using Key    = std::string;
  using Filter = model::SignalsRequestedSetsFilter;

  static constexpr MapKind          kKind = MapKind::kSignalsRequested;
  static constexpr std::string_view kName = "SignalsRequestedSets";

  static const Key& KeyOf(const Record& r) {
    return r.signal_id;
  }
  static void   Normalize(Record&) {}
  static void   Encode(const Record& r, Params& out);
  static Record Decode(const Row& row);
};

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

/*
  One entry per (identity, key) of rows. When a key occurs more than once
  the LAST occurrence is kept, at the position of the first one.
*/
template <typename RecordT>
std::vector<const RecordT*> CollapseDuplicateKeys(const std::vector<RecordT>& rows) {
  using Codec = MapCodec<RecordT>;
  using RowId = std::tuple<std::int64_t, std::string, std::string, std::string, typename Codec::Key>;

  std::map<RowId, std::size_t> position;
  std::vector<const RecordT*>  out;
  out.reserve(rows.size());

  for (const auto& r : rows) {
    RowId id{r.execution.shard_id, r.execution.domain_id, r.execution.workflow_id, r.execution.run_id, Codec::KeyOf(r)};
    auto [it, inserted] = position.emplace(std::move(id), out.size());
    if (inserted) {
      out.push_back(&r);
    } else {
      out[it->second] = &r;
    }
  }
  return out;
}

} // namespace wfstore::db::sql
