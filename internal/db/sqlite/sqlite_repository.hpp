#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace brewmon::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::DeliveryRecord> FindOpenDelivery(Transaction&, std::uint32_t group_number) override;
  Result CreateDelivery(Transaction&, model::DeliveryRecord&) override;
  Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) override;
  std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::uint64_t id) override;
  std::vector<model::DeliveryRecord> ListDeliveries(Transaction&, const DeliveryFilter&, const Pagination&) override;
  std::uint64_t CountDeliveries(Transaction&, const DeliveryFilter&) override;

  Result InsertMaintenanceLog(Transaction&, model::MaintenanceLogRecord&) override;
  std::vector<model::MaintenanceLogRecord> ListMaintenanceLogs(Transaction&, std::size_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
