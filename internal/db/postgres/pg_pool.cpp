#include "pg_pool.hpp"

namespace wfstore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire(const Context& ctx) {
  // wakes the wait below; declared before the lock so it is released after it
  CancelSubscription wake(ctx.Token(), [this]() {
    std::lock_guard lock(mutex_);
    cv_.notify_all();
  });

  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (ctx.IsCancelled() || ctx.IsExpired()) {
        return nullptr;
      }

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          return Wrap(new pqxx::connection(conninfo_));
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      const auto ready = [this, &ctx] {
        return !idle_.empty() || live_connections_ < max_connections_ || ctx.IsCancelled();
      };
      if (const auto& deadline = ctx.Deadline()) {
        cv_.wait_until(lock, *deadline, ready);
      } else {
        cv_.wait(lock, ready);
      }
    }
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace wfstore::db::postgres
