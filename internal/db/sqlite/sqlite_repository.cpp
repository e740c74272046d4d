#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace brewmon::db::sqlite {

using brewmon::db::ErrorCode;
using brewmon::db::Result;

namespace {

constexpr const char* kDeliveryColumns =
    "id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive";

// Finalizes on scope exit.
struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 is stored as NULL
void BindOptionalU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::DeliveryRecord ReadDelivery(sqlite3_stmt* st) {
  model::DeliveryRecord r;
  r.id              = ColU64(st, 0);
  r.coffee_type     = ColText(st, 1);
  r.group_number    = static_cast<uint32_t>(sqlite3_column_int(st, 2));
  r.status          = model::StatusFromString(ColText(st, 3));
  r.trigger_type    = model::TriggerFromString(ColText(st, 4));
  r.started_at_ms   = ColU64(st, 5);
  r.completed_at_ms = ColU64(st, 6);
  r.error_message   = ColText(st, 7);
  r.retroactive     = sqlite3_column_int(st, 8) != 0;
  return r;
}

/*
  WHERE clause for a DeliveryFilter. Placeholders are bound in the same
  order by BindFilter.
*/
std::string FilterClause(const DeliveryFilter& f) {
  std::vector<std::string> terms;
  if (f.trigger_type) terms.emplace_back("trigger_type=?");
  if (f.group_number) terms.emplace_back("group_number=?");
  if (f.status) terms.emplace_back("status=?");
  if (terms.empty()) return {};

  std::string clause = " WHERE ";
  for (std::size_t i = 0; i < terms.size(); ++i) {
    if (i > 0) clause += " AND ";
    clause += terms[i];
  }
  return clause;
}

int BindFilter(sqlite3_stmt* st, const DeliveryFilter& f) {
  int idx = 1;
  if (f.trigger_type) BindText(st, idx++, model::TriggerToString(*f.trigger_type));
  if (f.group_number) BindU64(st, idx++, *f.group_number);
  if (f.status) BindText(st, idx++, model::StatusToString(*f.status));
  return idx;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

std::optional<model::DeliveryRecord> SqliteRepository::FindOpenDelivery(Transaction& t, std::uint32_t group_number) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kDeliveryColumns +
                                    " FROM coffee_delivery WHERE group_number=? AND status IN ('started','in_progress')"
                                    " ORDER BY id DESC LIMIT 1;");
  BindU64(st.get(), 1, group_number);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDelivery(st.get());
}

Result SqliteRepository::CreateDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO coffee_delivery(coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive)"
      " VALUES(?,?,?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt st(raw);

  BindText(st.get(), 1, r.coffee_type);
  BindU64(st.get(), 2, r.group_number);
  BindText(st.get(), 3, model::StatusToString(r.status));
  BindText(st.get(), 4, model::TriggerToString(r.trigger_type));
  BindU64(st.get(), 5, r.started_at_ms);
  BindOptionalU64(st.get(), 6, r.completed_at_ms);
  BindOptionalText(st.get(), 7, r.error_message);
  sqlite3_bind_int(st.get(), 8, r.retroactive ? 1 : 0);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE coffee_delivery SET coffee_type=?,group_number=?,status=?,trigger_type=?,started_at=?,completed_at=?,"
      "error_message=?,retroactive=? WHERE id=?;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt st(raw);

  BindText(st.get(), 1, r.coffee_type);
  BindU64(st.get(), 2, r.group_number);
  BindText(st.get(), 3, model::StatusToString(r.status));
  BindText(st.get(), 4, model::TriggerToString(r.trigger_type));
  BindU64(st.get(), 5, r.started_at_ms);
  BindOptionalU64(st.get(), 6, r.completed_at_ms);
  BindOptionalText(st.get(), 7, r.error_message);
  sqlite3_bind_int(st.get(), 8, r.retroactive ? 1 : 0);
  BindU64(st.get(), 9, r.id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
  return Result::Ok();
}

std::optional<model::DeliveryRecord> SqliteRepository::GetDelivery(Transaction& t, std::uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kDeliveryColumns + " FROM coffee_delivery WHERE id=?;");
  BindU64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDelivery(st.get());
}

std::vector<model::DeliveryRecord> SqliteRepository::ListDeliveries(Transaction& t, const DeliveryFilter& filter, const Pagination& page) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kDeliveryColumns + " FROM coffee_delivery" + FilterClause(filter) +
             " ORDER BY started_at DESC, id DESC LIMIT ? OFFSET ?;";
  auto st  = PrepareOrThrow(db, sql);
  int  idx = BindFilter(st.get(), filter);
  // LIMIT -1 means no limit in sqlite
  sqlite3_bind_int64(st.get(), idx++, page.limit > 0 ? static_cast<sqlite3_int64>(page.limit) : -1);
  BindU64(st.get(), idx, page.offset);

  std::vector<model::DeliveryRecord> out;
  int                                rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadDelivery(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite list deliveries: ") + sqlite3_errmsg(db));
  }
  return out;
}

std::uint64_t SqliteRepository::CountDeliveries(Transaction& t, const DeliveryFilter& filter) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM coffee_delivery" + FilterClause(filter) + ";");
  BindFilter(st.get(), filter);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite count deliveries: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Maintenance log
// ------------------------------------------------------------------

Result SqliteRepository::InsertMaintenanceLog(Transaction& t, model::MaintenanceLogRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO maintenance_log(log_type,group_number,message,resolved,created_at) VALUES(?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt st(raw);

  BindText(st.get(), 1, r.log_type);
  BindOptionalU64(st.get(), 2, r.group_number);
  BindText(st.get(), 3, r.message);
  sqlite3_bind_int(st.get(), 4, r.resolved ? 1 : 0);
  BindU64(st.get(), 5, r.created_at_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::MaintenanceLogRecord> SqliteRepository::ListMaintenanceLogs(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT id,log_type,group_number,message,resolved,created_at FROM maintenance_log"
                             " ORDER BY id DESC LIMIT ?;");
  sqlite3_bind_int64(st.get(), 1, limit > 0 ? static_cast<sqlite3_int64>(limit) : -1);

  std::vector<model::MaintenanceLogRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::MaintenanceLogRecord r;
    r.id            = ColU64(st.get(), 0);
    r.log_type      = ColText(st.get(), 1);
    r.group_number  = static_cast<uint32_t>(sqlite3_column_int(st.get(), 2));
    r.message       = ColText(st.get(), 3);
    r.resolved      = sqlite3_column_int(st.get(), 4) != 0;
    r.created_at_ms = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace brewmon::db::sqlite
