#include "internal/db/sql/query_templates.hpp"

#include <algorithm>

namespace wfstore::db::sql {

namespace {

// identity columns occupy $1..$4, so variadic lists start at $5
constexpr std::size_t kFirstVariadicIndex = 5;

std::string JoinNames(const std::vector<ColumnSpec>& columns) {
  std::string out;
  for (const auto& column : columns) {
    if (!out.empty()) out += ", ";
    out += column.name;
  }
  return out;
}

std::vector<ColumnSpec> PrimaryKeyColumns(const MapSchema& schema) {
  std::vector<ColumnSpec> columns(IdentityColumns().begin(), IdentityColumns().end());
  columns.push_back(schema.key);
  return columns;
}

std::string IdentityPredicate(Dialect dialect) {
  std::string out;
  std::size_t index = 1;
  for (const auto& column : IdentityColumns()) {
    if (!out.empty()) out += " AND ";
    out += column.name + " = " + Placeholder(dialect, index++);
  }
  return out;
}

void CheckParameterCount(Dialect dialect, std::size_t count, std::size_t max_parameters, std::string_view what) {
  const auto limit = std::min(MaxBoundParameters(dialect), max_parameters);
  if (count > limit) {
    throw ParameterExpansionError(std::string(what) + " needs " + std::to_string(count) + " parameters, " +
                                  std::string(DialectName(dialect)) + " accepts at most " + std::to_string(limit));
  }
}

} // namespace

std::string_view DialectName(Dialect dialect) {
  switch (dialect) {
    case Dialect::kPostgres:
      return "postgres";
    case Dialect::kSqlite:
      return "sqlite";
  }
  return "unknown";
}

std::size_t MaxBoundParameters(Dialect dialect) {
  switch (dialect) {
    case Dialect::kPostgres:
      return 65535;
    case Dialect::kSqlite:
      // SQLITE_MAX_VARIABLE_NUMBER default since 3.32
      return 32766;
  }
  return 0;
}

std::string Placeholder(Dialect dialect, std::size_t index) {
  return (dialect == Dialect::kPostgres ? "$" : "?") + std::to_string(index);
}

std::string BindExpression(Dialect dialect, ColumnType type, std::size_t index) {
  if (dialect == Dialect::kPostgres && type == ColumnType::kTimestamp) {
    return "(TIMESTAMP 'epoch' + " + Placeholder(dialect, index) + "::bigint * INTERVAL '1 microsecond')";
  }
  return Placeholder(dialect, index);
}

std::string SelectExpression(Dialect dialect, const ColumnSpec& column) {
  if (dialect == Dialect::kPostgres && column.type == ColumnType::kTimestamp) {
    return "(EXTRACT(EPOCH FROM " + column.name + ") * 1000000)::bigint";
  }
  return column.name;
}

std::string ExpandKeySet(Dialect dialect, std::size_t first_index, std::size_t count, std::size_t max_parameters) {
  if (count == 0) {
    throw ParameterExpansionError("cannot expand an empty key set");
  }
  CheckParameterCount(dialect, first_index + count - 1, max_parameters, "key set");

  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) out += ",";
    out += Placeholder(dialect, first_index + i);
  }
  return out;
}

QueryTemplates BuildQueryTemplates(const MapSchema& schema, Dialect dialect) {
  QueryTemplates t;
  t.kind    = schema.kind;
  t.dialect = dialect;

  auto all_columns = PrimaryKeyColumns(schema);
  const auto primary_key = JoinNames(all_columns);
  all_columns.insert(all_columns.end(), schema.value_columns.begin(), schema.value_columns.end());
  for (const auto& column : all_columns) {
    t.row_columns.push_back(column.type);
  }

  t.upsert_prefix = "INSERT INTO " + schema.table_name + " (" + JoinNames(all_columns) + ") VALUES ";
  t.upsert_suffix = " ON CONFLICT (" + primary_key + ") DO ";
  if (schema.value_columns.empty()) {
    t.upsert_suffix += "NOTHING";
  } else {
    t.upsert_suffix += "UPDATE SET ";
    for (std::size_t i = 0; i < schema.value_columns.size(); ++i) {
      const auto& name = schema.value_columns[i].name;
      if (i > 0) t.upsert_suffix += ", ";
      t.upsert_suffix += name + " = excluded." + name;
    }
  }

  std::string selected = schema.key.name;
  for (const auto& column : schema.value_columns) {
    selected += ", " + SelectExpression(dialect, column);
  }

  const auto where = " WHERE " + IdentityPredicate(dialect);

  t.select_all            = "SELECT " + selected + " FROM " + schema.table_name + where;
  t.delete_by_keys_prefix = "DELETE FROM " + schema.table_name + where + " AND " + schema.key.name + " IN (";
  t.delete_all            = "DELETE FROM " + schema.table_name + where;
  return t;
}

std::string RenderUpsert(const QueryTemplates& t, std::size_t row_count, std::size_t max_parameters) {
  if (row_count == 0) {
    throw ParameterExpansionError("cannot expand an upsert without rows");
  }
  const auto width = t.row_columns.size();
  CheckParameterCount(t.dialect, row_count * width, max_parameters, "upsert");

  std::string sql = t.upsert_prefix;
  std::size_t index = 1;
  for (std::size_t r = 0; r < row_count; ++r) {
    sql += r == 0 ? "(" : ", (";
    for (std::size_t c = 0; c < width; ++c) {
      if (c > 0) sql += ", ";
      sql += BindExpression(t.dialect, t.row_columns[c], index++);
    }
    sql += ")";
  }
  sql += t.upsert_suffix;
  return sql;
}

std::string RenderDeleteByKeys(const QueryTemplates& t, std::size_t key_count, std::size_t max_parameters) {
  return t.delete_by_keys_prefix + ExpandKeySet(t.dialect, kFirstVariadicIndex, key_count, max_parameters) + ")";
}

} // namespace wfstore::db::sql
