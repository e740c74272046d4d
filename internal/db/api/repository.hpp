#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/maintenance_log_record.hpp"

namespace brewmon::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Ids are assigned by the store on create
  - Records are never deleted

  The DB is the source of truth for:
    delivery lifecycle
    maintenance log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  // Open = status Started or InProgress. Any trigger type.
  virtual std::optional<model::DeliveryRecord> FindOpenDelivery(Transaction&, std::uint32_t group_number) = 0;

  // Assigns record.id on success.
  virtual Result CreateDelivery(Transaction&, model::DeliveryRecord& record) = 0;

  virtual Result UpdateDelivery(Transaction&, const model::DeliveryRecord& record) = 0;

  virtual std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::DeliveryRecord> ListDeliveries(Transaction&, const DeliveryFilter& filter, const Pagination& page) = 0;

  virtual std::uint64_t CountDeliveries(Transaction&, const DeliveryFilter& filter) = 0;

  // ---------------------------------------------------------------------
  // Maintenance log
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertMaintenanceLog(Transaction&, model::MaintenanceLogRecord& record) = 0;

  // Newest first.
  virtual std::vector<model::MaintenanceLogRecord> ListMaintenanceLogs(Transaction&, std::size_t limit) = 0;
};

} // namespace brewmon::db
