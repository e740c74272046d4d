#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace brewmon::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::uint64_t, model::DeliveryRecord>       deliveries;
    std::vector<model::MaintenanceLogRecord>             maintenance_log;
    std::uint64_t next_delivery_id = 1;
    std::uint64_t next_log_id      = 1;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

}
