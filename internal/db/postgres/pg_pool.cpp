#include "pg_pool.hpp"

namespace brewmon::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_open_delivery",
               "SELECT id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive "
               "FROM coffee_delivery WHERE group_number=$1 AND status IN ('started','in_progress') "
               "ORDER BY id DESC LIMIT 1");

  conn.prepare("get_delivery",
               "SELECT id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive "
               "FROM coffee_delivery WHERE id=$1");

  conn.prepare("insert_delivery",
               "INSERT INTO coffee_delivery(coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");

  conn.prepare("update_delivery",
               "UPDATE coffee_delivery SET coffee_type=$2,group_number=$3,status=$4,trigger_type=$5,started_at=$6,"
               "completed_at=$7,error_message=$8,retroactive=$9 WHERE id=$1");

  conn.prepare("insert_maintenance_log",
               "INSERT INTO maintenance_log(log_type,group_number,message,resolved,created_at) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");

  conn.prepare("list_maintenance_logs",
               "SELECT id,log_type,group_number,message,resolved,created_at FROM maintenance_log "
               "ORDER BY id DESC LIMIT $1");
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS coffee_delivery (id BIGSERIAL PRIMARY KEY, coffee_type TEXT NOT NULL, group_number INTEGER NOT NULL, status TEXT NOT NULL, trigger_type TEXT NOT NULL, started_at BIGINT NOT NULL, completed_at BIGINT, error_message TEXT, retroactive BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("CREATE INDEX IF NOT EXISTS coffee_delivery_open_idx ON coffee_delivery(group_number, status);");
  tx.exec("CREATE TABLE IF NOT EXISTS maintenance_log (id BIGSERIAL PRIMARY KEY, log_type TEXT NOT NULL, group_number INTEGER, message TEXT NOT NULL, resolved BOOLEAN NOT NULL DEFAULT FALSE, created_at BIGINT NOT NULL);");

  tx.exec("SELECT id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive FROM coffee_delivery LIMIT 1;");
  tx.exec("SELECT id,log_type,group_number,message,resolved,created_at FROM maintenance_log LIMIT 1;");
  tx.commit();
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
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace brewmon::db::postgres
