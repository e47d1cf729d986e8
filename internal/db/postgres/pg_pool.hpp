#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/api/context.hpp"

namespace wfstore::db::postgres {

/*
  PgPool

  Bounded connection pool of ONE physical shard.

  Design notes:
  -------------
  - Each statement gets its own connection for its whole pqxx::work.
  - libpqxx connections are NOT thread-safe, do not share.
  - A connection found closed on release is dropped instead of going
    back to the idle list.

  Lifetime:
    PgExecutor owns shared_ptr<PgPool>
    a statement holds shared_ptr<pqxx::connection> (returned on release)
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection, blocking while the pool is exhausted.
  // Returns nullptr when ctx expires or is cancelled before one frees up.
  // Throws what pqxx::connection throws when a new connection fails.
  std::shared_ptr<pqxx::connection> Acquire(const Context& ctx);

  std::size_t MaxConnections() const {
    return max_connections_;
  }

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace wfstore::db::postgres
