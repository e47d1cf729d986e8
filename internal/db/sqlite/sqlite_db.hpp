#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace wfstore::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms = 5000;
  bool wal_mode        = true;
};

/*
  Thin RAII wrapper around the sqlite3* of one physical shard.

  The handle is shared by every call routed to the shard. sqlite3_errmsg,
  sqlite3_changes and the progress handler are per connection, so a
  statement holds Mutex() from prepare to finalize.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  int BusyTimeoutMs() const {
    return options_.busy_timeout_ms;
  }

  // Runs one or more statements without parameters (pragmas, DDL). Throws
  // std::runtime_error with the sqlite message.
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    mutex_;
};

} // namespace wfstore::db::sqlite
