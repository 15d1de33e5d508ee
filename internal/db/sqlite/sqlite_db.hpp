#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace roombook::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode        = true;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction, so transactions serialize
  on TxMutex() for their whole lifetime (sqlite has a single transaction
  per connection).
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Create tables and indexes if missing.
  void BootstrapSchema();

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace roombook::db::sqlite
