#include "sqlite_db.hpp"

#include <stdexcept>

namespace brewmon::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::BootstrapSchema() {
  static const char* kBootstrapSql[] = {
      "CREATE TABLE IF NOT EXISTS coffee_delivery ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " coffee_type TEXT NOT NULL,"
      " group_number INTEGER NOT NULL,"
      " status TEXT NOT NULL,"
      " trigger_type TEXT NOT NULL,"
      " started_at INTEGER NOT NULL,"
      " completed_at INTEGER,"
      " error_message TEXT,"
      " retroactive INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS coffee_delivery_open_idx ON coffee_delivery(group_number, status);",
      "CREATE TABLE IF NOT EXISTS maintenance_log ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " log_type TEXT NOT NULL,"
      " group_number INTEGER,"
      " message TEXT NOT NULL,"
      " resolved INTEGER NOT NULL DEFAULT 0,"
      " created_at INTEGER NOT NULL);"};

  for (const char* sql : kBootstrapSql) {
    Exec(sql);
  }

  Exec("SELECT id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive FROM coffee_delivery LIMIT 1;");
  Exec("SELECT id,log_type,group_number,message,resolved,created_at FROM maintenance_log LIMIT 1;");
}

void SqliteDB::Configure() {
  // WAL lets report queries run while a cycle holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace brewmon::db::sqlite
