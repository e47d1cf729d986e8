#pragma once

#include <cstdint>
#include <string>

#include "internal/db/sql/sql_params.hpp"

namespace wfstore::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into the row codec.
  Getters throw std::runtime_error on a value the backend cannot convert.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual Blob GetBlob(int col) const = 0;
  virtual bool IsNull(int col) const = 0;
};

} // namespace wfstore::db::sql
