#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/sql/schema_registry.hpp"

namespace wfstore::db::sql {

enum class Dialect {
  kPostgres,
  kSqlite,
};

std::string_view DialectName(Dialect dialect);

// Most placeholders one statement may carry.
std::size_t MaxBoundParameters(Dialect dialect);

// No limit below the dialect's own.
inline constexpr std::size_t kDialectLimit = std::numeric_limits<std::size_t>::max();

/*
  Raised when a variadic parameter list cannot be laid out for the dialect
  (empty list, or more parameters than the backend accepts). Always thrown
  before anything reaches the backend.
*/
class ParameterExpansionError : public std::runtime_error {
 public:
  explicit ParameterExpansionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// $7 / ?7   (index is 1-based)
std::string Placeholder(Dialect dialect, std::size_t index);

// Placeholder converted from its wire type to the column's storage type.
std::string BindExpression(Dialect dialect, ColumnType type, std::size_t index);

// Column converted from its storage type to its wire type.
std::string SelectExpression(Dialect dialect, const ColumnSpec& column);

// "$5,$6,$7" for first_index=5, count=3. max_parameters lowers the dialect
// limit to what the connection accepts.
std::string ExpandKeySet(Dialect dialect, std::size_t first_index, std::size_t count,
                         std::size_t max_parameters = kDialectLimit);

/*
  Statement templates for one map table in one dialect.

  Built once at startup. The two variadic statements are kept as fixed text
  around the part that depends on the call:

    upsert           = upsert_prefix + <row tuples> + upsert_suffix
    delete by keys   = delete_by_keys_prefix + <key placeholders> + ")"

  select_all and delete_all are complete and bind the identity as $1..$4.
  No caller value is ever spliced into the text.
*/
struct QueryTemplates {
  MapKind kind    = MapKind::kActivityInfo;
  Dialect dialect = Dialect::kPostgres;

  // identity, key, values: the bind order of one upsert row
  std::vector<ColumnType> row_columns;

  std::string upsert_prefix;
  std::string upsert_suffix;
  std::string select_all;
  std::string delete_by_keys_prefix;
  std::string delete_all;
};

QueryTemplates BuildQueryTemplates(const MapSchema& schema, Dialect dialect);

// Batched upsert for row_count rows. Throws ParameterExpansionError.
std::string RenderUpsert(const QueryTemplates& templates, std::size_t row_count, std::size_t max_parameters = kDialectLimit);

// Delete of key_count keys of one execution. Throws ParameterExpansionError.
std::string RenderDeleteByKeys(const QueryTemplates& templates, std::size_t key_count,
                               std::size_t max_parameters = kDialectLimit);

} // namespace wfstore::db::sql
