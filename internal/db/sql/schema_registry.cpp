#include "internal/db/sql/schema_registry.hpp"

#include <set>
#include <stdexcept>

namespace wfstore::db::sql {

std::string_view MapKindName(MapKind kind) {
  switch (kind) {
    case MapKind::kActivityInfo:
      return "activity_info";
    case MapKind::kTimerInfo:
      return "timer_info";
    case MapKind::kChildExecutionInfo:
      return "child_execution_info";
    case MapKind::kRequestCancelInfo:
      return "request_cancel_info";
    case MapKind::kSignalInfo:
      return "signal_info";
    case MapKind::kSignalsRequested:
      return "signals_requested";
  }
  return "unknown";
}

std::optional<MapKind> ParseMapKind(std::string_view name) {
  for (auto kind : kAllMapKinds) {
    if (MapKindName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

const std::array<ColumnSpec, 4>& IdentityColumns() {
  static const std::array<ColumnSpec, 4> kColumns = {
      ColumnSpec{"shard_id", ColumnType::kInt64},
      ColumnSpec{"domain_id", ColumnType::kText},
      ColumnSpec{"workflow_id", ColumnType::kText},
      ColumnSpec{"run_id", ColumnType::kText},
  };
  return kColumns;
}

namespace {

std::vector<ColumnSpec> PayloadColumns() {
  return {{"data", ColumnType::kBlob}, {"data_encoding", ColumnType::kText}};
}

void Validate(const MapSchema& schema) {
  if (schema.table_name.empty()) {
    throw std::invalid_argument("map schema without table name");
  }
  if (schema.key.name.empty()) {
    throw std::invalid_argument("map schema " + schema.table_name + " without key column");
  }

  std::set<std::string> names;
  for (const auto& column : IdentityColumns()) {
    names.insert(column.name);
  }
  if (!names.insert(schema.key.name).second) {
    throw std::invalid_argument("map schema " + schema.table_name + ": key column collides with identity column");
  }
  for (const auto& column : schema.value_columns) {
    if (column.name.empty() || !names.insert(column.name).second) {
      throw std::invalid_argument("map schema " + schema.table_name + ": duplicate or empty column '" + column.name + "'");
    }
  }
}

} // namespace

SchemaRegistry SchemaRegistry::Default() {
  std::vector<MapSchema> schemas;

  MapSchema activity{.kind = MapKind::kActivityInfo, .table_name = "activity_info_maps", .key = {"schedule_id", ColumnType::kInt64}};
  activity.value_columns = PayloadColumns();
  activity.value_columns.push_back({"last_heartbeat_details", ColumnType::kBlob});
  activity.value_columns.push_back({"last_heartbeat_updated_time", ColumnType::kTimestamp});
  schemas.push_back(std::move(activity));

  schemas.push_back({MapKind::kTimerInfo, "timer_info_maps", {"timer_id", ColumnType::kText}, PayloadColumns()});
  schemas.push_back({MapKind::kChildExecutionInfo, "child_execution_info_maps", {"initiated_id", ColumnType::kInt64}, PayloadColumns()});
  schemas.push_back({MapKind::kRequestCancelInfo, "request_cancel_info_maps", {"initiated_id", ColumnType::kInt64}, PayloadColumns()});
  schemas.push_back({MapKind::kSignalInfo, "signal_info_maps", {"initiated_id", ColumnType::kInt64}, PayloadColumns()});

  // existence-only set: no value columns
  schemas.push_back({MapKind::kSignalsRequested, "signals_requested_sets", {"signal_id", ColumnType::kText}, {}});

  return SchemaRegistry(std::move(schemas));
}

SchemaRegistry::SchemaRegistry(std::vector<MapSchema> schemas) {
  if (schemas.size() != kMapKindCount) {
    throw std::invalid_argument("schema registry needs exactly " + std::to_string(kMapKindCount) + " map schemas, got " +
                                std::to_string(schemas.size()));
  }

  std::array<bool, kMapKindCount> seen{};
  for (auto& schema : schemas) {
    Validate(schema);
    auto index = static_cast<std::size_t>(schema.kind);
    if (index >= kMapKindCount || seen[index]) {
      throw std::invalid_argument("map kind described twice: " + std::string(MapKindName(schema.kind)));
    }
    seen[index]     = true;
    schemas_[index] = std::move(schema);
  }
}

} // namespace wfstore::db::sql
