#include "internal/db/sql/row_codec.hpp"

namespace wfstore::db::sql {

using std::chrono::microseconds;

std::int64_t ToEpochMicros(model::TimePoint tp) {
  return std::chrono::floor<microseconds>(tp.time_since_epoch()).count();
}

model::TimePoint FromEpochMicros(std::int64_t micros) {
  return model::TimePoint{} + std::chrono::duration_cast<model::TimePoint::duration>(microseconds(micros));
}

model::TimePoint NormalizeTimestamp(model::TimePoint tp) {
  return FromEpochMicros(ToEpochMicros(tp));
}

void EncodeIdentity(const model::ExecutionIdentity& execution, Params& out) {
  out.emplace_back(execution.shard_id);
  out.emplace_back(execution.domain_id);
  out.emplace_back(execution.workflow_id);
  out.emplace_back(execution.run_id);
}

namespace {

// data, data_encoding
template <typename RecordT>
void EncodePayload(const RecordT& r, Params& out) {
  out.emplace_back(r.data);
  out.emplace_back(r.data_encoding);
}

template <typename RecordT>
void DecodePayload(const Row& row, RecordT& r) {
  r.data          = row.IsNull(1) ? Blob{} : row.GetBlob(1);
  r.data_encoding = row.IsNull(2) ? std::string{} : row.GetText(2);
}

} // namespace

// ------------------------------------------------------------------
// activity_info_maps
// ------------------------------------------------------------------

void MapCodec<model::ActivityInfoMapsRow>::Normalize(Record& r) {
  r.last_heartbeat_updated_time = NormalizeTimestamp(r.last_heartbeat_updated_time);
}

void MapCodec<model::ActivityInfoMapsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.schedule_id);
  EncodePayload(r, out);
  out.emplace_back(r.last_heartbeat_details);
  out.emplace_back(ToEpochMicros(r.last_heartbeat_updated_time));
}

model::ActivityInfoMapsRow MapCodec<model::ActivityInfoMapsRow>::Decode(const Row& row) {
  Record r;
  r.schedule_id = row.GetInt64(0);
  DecodePayload(row, r);
  r.last_heartbeat_details      = row.IsNull(3) ? Blob{} : row.GetBlob(3);
  r.last_heartbeat_updated_time = row.IsNull(4) ? model::TimePoint{} : FromEpochMicros(row.GetInt64(4));
  return r;
}

// ------------------------------------------------------------------
// timer_info_maps
// ------------------------------------------------------------------

void MapCodec<model::TimerInfoMapsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.timer_id);
  EncodePayload(r, out);
}

model::TimerInfoMapsRow MapCodec<model::TimerInfoMapsRow>::Decode(const Row& row) {
  Record r;
  r.timer_id = row.GetText(0);
  DecodePayload(row, r);
  return r;
}

// ------------------------------------------------------------------
// child_execution_info_maps
// ------------------------------------------------------------------

void MapCodec<model::ChildExecutionInfoMapsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.initiated_id);
  EncodePayload(r, out);
}

model::ChildExecutionInfoMapsRow MapCodec<model::ChildExecutionInfoMapsRow>::Decode(const Row& row) {
  Record r;
  r.initiated_id = row.GetInt64(0);
  DecodePayload(row, r);
  return r;
}

// ------------------------------------------------------------------
// request_cancel_info_maps
// ------------------------------------------------------------------

void MapCodec<model::RequestCancelInfoMapsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.initiated_id);
  EncodePayload(r, out);
}

model::RequestCancelInfoMapsRow MapCodec<model::RequestCancelInfoMapsRow>::Decode(const Row& row) {
  Record r;
  r.initiated_id = row.GetInt64(0);
  DecodePayload(row, r);
  return r;
}

// ------------------------------------------------------------------
// signal_info_maps
// ------------------------------------------------------------------

void MapCodec<model::SignalInfoMapsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.initiated_id);
  EncodePayload(r, out);
}

model::SignalInfoMapsRow MapCodec<model::SignalInfoMapsRow>::Decode(const Row& row) {
  Record r;
  r.initiated_id = row.GetInt64(0);
  DecodePayload(row, r);
  return r;
}

// ------------------------------------------------------------------
// signals_requested_sets
// ------------------------------------------------------------------

void MapCodec<model::SignalsRequestedSetsRow>::Encode(const Record& r, Params& out) {
  out.emplace_back(r.signal_id);
}

model::SignalsRequestedSetsRow MapCodec<model::SignalsRequestedSetsRow>::Decode(const Row& row) {
  Record r;
  r.signal_id = row.GetText(0);
  return r;
}

} // namespace wfstore::db::sql
