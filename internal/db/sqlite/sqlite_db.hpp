#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace brewmon::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // One transaction at a time per connection; held by SqliteTransaction.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Creates coffee_delivery and maintenance_log if missing, then probes
  // every column so a stale layout fails at startup.
  void BootstrapSchema();

  // WAL, busy timeout
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace brewmon::db::sqlite
