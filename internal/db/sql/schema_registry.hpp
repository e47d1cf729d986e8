#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wfstore::db::sql {

enum class MapKind {
  kActivityInfo = 0,
  kTimerInfo,
  kChildExecutionInfo,
  kRequestCancelInfo,
  kSignalInfo,
  kSignalsRequested,
};

inline constexpr std::size_t kMapKindCount = 6;

inline constexpr std::array<MapKind, kMapKindCount> kAllMapKinds = {
    MapKind::kActivityInfo,      MapKind::kTimerInfo,  MapKind::kChildExecutionInfo,
    MapKind::kRequestCancelInfo, MapKind::kSignalInfo, MapKind::kSignalsRequested,
};

// "activity_info", "timer_info", ...
std::string_view       MapKindName(MapKind kind);
std::optional<MapKind> ParseMapKind(std::string_view name);

enum class ColumnType {
  kInt64,
  kText,
  kBlob,
  kTimestamp,  // int64 epoch microseconds on the wire
};

struct ColumnSpec {
  std::string name;
  ColumnType  type = ColumnType::kText;
};

/*
  Declarative description of one execution-map table.

  Every table has the identity columns (IdentityColumns()) followed by the
  map key; together they form the primary key. value_columns are everything
  else, in the order rows are encoded and selected.
*/
struct MapSchema {
  MapKind                 kind = MapKind::kActivityInfo;
  std::string             table_name;
  ColumnSpec              key;
  std::vector<ColumnSpec> value_columns;
};

// shard_id, domain_id, workflow_id, run_id
const std::array<ColumnSpec, 4>& IdentityColumns();

/*
  SchemaRegistry

  Immutable set of MapSchema, one per MapKind. Built once by the composition
  root and shared read-only; the query templates and the bootstrap DDL are
  both derived from it.
*/
class SchemaRegistry {
 public:
  // The six execution-map tables.
  static SchemaRegistry Default();

  // Throws std::invalid_argument unless every MapKind is described exactly
  // once with a table name, a key column and distinct column names.
  explicit SchemaRegistry(std::vector<MapSchema> schemas);

  const MapSchema& Get(MapKind kind) const {
    return schemas_[static_cast<std::size_t>(kind)];
  }

  const std::array<MapSchema, kMapKindCount>& All() const {
    return schemas_;
  }

 private:
  std::array<MapSchema, kMapKindCount> schemas_;
};

} // namespace wfstore::db::sql
