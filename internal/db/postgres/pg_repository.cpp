#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace brewmon::db::postgres {

namespace {

std::optional<uint64_t> NullIfZero(uint64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::DeliveryRecord ReadDelivery(const pqxx::row& row) {
  model::DeliveryRecord r;
  r.id              = row[0].as<uint64_t>();
  r.coffee_type     = row[1].c_str();
  r.group_number    = row[2].as<uint32_t>();
  r.status          = model::StatusFromString(row[3].c_str());
  r.trigger_type    = model::TriggerFromString(row[4].c_str());
  r.started_at_ms   = row[5].as<uint64_t>();
  r.completed_at_ms = row[6].is_null() ? 0 : row[6].as<uint64_t>();
  r.error_message   = row[7].is_null() ? "" : row[7].c_str();
  r.retroactive     = row[8].as<bool>();
  return r;
}

// Builds "WHERE ..." with $n placeholders; values land in params in order.
std::string FilterClause(const DeliveryFilter& f, pqxx::params& params, int& next) {
  std::string clause;
  auto        add = [&](const char* column) {
    clause += clause.empty() ? " WHERE " : " AND ";
    clause += column;
    clause += "=$" + std::to_string(next++);
  };

  if (f.trigger_type) {
    add("trigger_type");
    params.append(std::string(model::TriggerToString(*f.trigger_type)));
  }
  if (f.group_number) {
    add("group_number");
    params.append(*f.group_number);
  }
  if (f.status) {
    add("status");
    params.append(std::string(model::StatusToString(*f.status)));
  }
  return clause;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<model::DeliveryRecord> PgRepository::FindOpenDelivery(Transaction& t, std::uint32_t group_number) {
  auto res = TX(t).Work().exec_prepared("find_open_delivery", group_number);
  if (res.empty()) return std::nullopt;
  return ReadDelivery(res[0]);
}

Result PgRepository::CreateDelivery(Transaction& t, model::DeliveryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_delivery", r.coffee_type, r.group_number, std::string(model::StatusToString(r.status)),
                                          std::string(model::TriggerToString(r.trigger_type)), r.started_at_ms,
                                          NullIfZero(r.completed_at_ms), NullIfEmpty(r.error_message), r.retroactive);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_delivery", r.id, r.coffee_type, r.group_number, std::string(model::StatusToString(r.status)),
                                          std::string(model::TriggerToString(r.trigger_type)), r.started_at_ms,
                                          NullIfZero(r.completed_at_ms), NullIfEmpty(r.error_message), r.retroactive);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeliveryRecord> PgRepository::GetDelivery(Transaction& t, std::uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_delivery", id);
  if (res.empty()) return std::nullopt;
  return ReadDelivery(res[0]);
}

std::vector<model::DeliveryRecord> PgRepository::ListDeliveries(Transaction& t, const DeliveryFilter& filter, const Pagination& page) {
  pqxx::params params;
  int          next = 1;
  auto         sql  = std::string("SELECT id,coffee_type,group_number,status,trigger_type,started_at,completed_at,error_message,retroactive "
                                            "FROM coffee_delivery") +
             FilterClause(filter, params, next) + " ORDER BY started_at DESC, id DESC";
  if (page.limit > 0) {
    sql += " LIMIT $" + std::to_string(next++);
    params.append(static_cast<int64_t>(page.limit));
  }
  sql += " OFFSET $" + std::to_string(next++);
  params.append(static_cast<int64_t>(page.offset));

  auto res = TX(t).Work().exec_params(sql, params);

  std::vector<model::DeliveryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDelivery(row));
  }
  return out;
}

std::uint64_t PgRepository::CountDeliveries(Transaction& t, const DeliveryFilter& filter) {
  pqxx::params params;
  int          next = 1;
  auto         sql  = "SELECT COUNT(*) FROM coffee_delivery" + FilterClause(filter, params, next);

  auto res = TX(t).Work().exec_params(sql, params);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::InsertMaintenanceLog(Transaction& t, model::MaintenanceLogRecord& r) {
  try {
    std::optional<uint32_t> group;
    if (r.group_number != 0) group = r.group_number;
    auto res = TX(t).Work().exec_prepared("insert_maintenance_log", r.log_type, group, r.message, r.resolved, r.created_at_ms);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MaintenanceLogRecord> PgRepository::ListMaintenanceLogs(Transaction& t, std::size_t limit) {
  std::optional<int64_t> bound;
  if (limit > 0) bound = static_cast<int64_t>(limit);
  auto res = TX(t).Work().exec_prepared("list_maintenance_logs", bound);

  std::vector<model::MaintenanceLogRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::MaintenanceLogRecord r;
    r.id            = row[0].as<uint64_t>();
    r.log_type      = row[1].c_str();
    r.group_number  = row[2].is_null() ? 0 : row[2].as<uint32_t>();
    r.message       = row[3].c_str();
    r.resolved      = row[4].as<bool>();
    r.created_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace brewmon::db::postgres
