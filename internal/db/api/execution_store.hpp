#pragma once

#include <vector>

#include "internal/db/api/context.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/model/activity_info_row.hpp"
#include "internal/db/model/child_execution_info_row.hpp"
#include "internal/db/model/request_cancel_info_row.hpp"
#include "internal/db/model/signal_info_row.hpp"
#include "internal/db/model/signals_requested_row.hpp"
#include "internal/db/model/timer_info_row.hpp"

namespace wfstore::db {

/*
  ExecutionStore

  Per-execution mutable collections ("maps") of a workflow run.

  CRITICAL GUARANTEES:

  - Every call is ONE statement against ONE physical shard.
    The shard is resolved from the logical shard id of the rows / filter.
  - ReplaceInto* is an atomic upsert: a colliding key replaces the whole row.
    Duplicated keys inside one batch: the last one wins.
  - ReplaceInto* with no rows and DeleteFrom* with an empty key list are
    no-ops that return OK without touching the backend.
  - DeleteFrom* with no key list (std::nullopt) deletes the whole collection
    of the execution.
  - SelectFrom* returns every item of the execution (filter.keys is not
    consulted) with the identity of the filter stamped onto each row; row
    order is unspecified. On success out is replaced and rows_affected is
    the number of rows returned; on failure out is left untouched.
  - Every row of one ReplaceInto* batch must route to the same physical
    shard, otherwise nothing is written and InvalidArgument is returned.
  - Backend failures come back as-is (code + driver message). No retries.

  Implementations hold no per-call mutable state and are safe to share
  between threads.
*/

class ExecutionStore {
 public:
  virtual ~ExecutionStore() = default;

  // ---------------------------------------------------------------------
  // activity_info_maps
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoActivityInfoMaps(const Context&, const std::vector<model::ActivityInfoMapsRow>& rows) = 0;

  virtual Result SelectFromActivityInfoMaps(const Context&, const model::ActivityInfoMapsFilter&,
                                            std::vector<model::ActivityInfoMapsRow>& out) = 0;

  virtual Result DeleteFromActivityInfoMaps(const Context&, const model::ActivityInfoMapsFilter&) = 0;

  // ---------------------------------------------------------------------
  // timer_info_maps
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoTimerInfoMaps(const Context&, const std::vector<model::TimerInfoMapsRow>& rows) = 0;

  virtual Result SelectFromTimerInfoMaps(const Context&, const model::TimerInfoMapsFilter&,
                                         std::vector<model::TimerInfoMapsRow>& out) = 0;

  virtual Result DeleteFromTimerInfoMaps(const Context&, const model::TimerInfoMapsFilter&) = 0;

  // ---------------------------------------------------------------------
  // child_execution_info_maps
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoChildExecutionInfoMaps(const Context&,
                                                   const std::vector<model::ChildExecutionInfoMapsRow>& rows) = 0;

  virtual Result SelectFromChildExecutionInfoMaps(const Context&, const model::ChildExecutionInfoMapsFilter&,
                                                  std::vector<model::ChildExecutionInfoMapsRow>& out) = 0;

  virtual Result DeleteFromChildExecutionInfoMaps(const Context&, const model::ChildExecutionInfoMapsFilter&) = 0;

  // ---------------------------------------------------------------------
  // request_cancel_info_maps
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoRequestCancelInfoMaps(const Context&,
                                                  const std::vector<model::RequestCancelInfoMapsRow>& rows) = 0;

  virtual Result SelectFromRequestCancelInfoMaps(const Context&, const model::RequestCancelInfoMapsFilter&,
                                                 std::vector<model::RequestCancelInfoMapsRow>& out) = 0;

  virtual Result DeleteFromRequestCancelInfoMaps(const Context&, const model::RequestCancelInfoMapsFilter&) = 0;

  // ---------------------------------------------------------------------
  // signal_info_maps
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoSignalInfoMaps(const Context&, const std::vector<model::SignalInfoMapsRow>& rows) = 0;

  virtual Result SelectFromSignalInfoMaps(const Context&, const model::SignalInfoMapsFilter&,
                                          std::vector<model::SignalInfoMapsRow>& out) = 0;

  virtual Result DeleteFromSignalInfoMaps(const Context&, const model::SignalInfoMapsFilter&) = 0;

  // ---------------------------------------------------------------------
  // signals_requested_sets
  // ---------------------------------------------------------------------

  virtual Result ReplaceIntoSignalsRequestedSets(const Context&,
                                                 const std::vector<model::SignalsRequestedSetsRow>& rows) = 0;

  virtual Result SelectFromSignalsRequestedSets(const Context&, const model::SignalsRequestedSetsFilter&,
                                                std::vector<model::SignalsRequestedSetsRow>& out) = 0;

  virtual Result DeleteFromSignalsRequestedSets(const Context&, const model::SignalsRequestedSetsFilter&) = 0;

  // ---------------------------------------------------------------------
  // Topology
  // ---------------------------------------------------------------------

  virtual int TotalPhysicalShards() const = 0;
};

} // namespace wfstore::db
