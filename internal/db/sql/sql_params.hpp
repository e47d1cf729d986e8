#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace wfstore::db::sql {

using Blob = std::vector<std::uint8_t>;

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ?1 ?2 ?3

  Both use ordered binding; the n-th Param binds to placeholder n.
  Timestamps travel as int64 epoch microseconds.
*/

using Param = std::variant<
    int64_t,
    std::string,
    Blob
>;

using Params = std::vector<Param>;

} // namespace wfstore::db::sql
