#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace brewmon::db::memory {

namespace {

bool Matches(const model::DeliveryRecord& r, const DeliveryFilter& f) {
  if (f.trigger_type && r.trigger_type != *f.trigger_type) return false;
  if (f.group_number && r.group_number != *f.group_number) return false;
  if (f.status && r.status != *f.status) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::DeliveryRecord> MemoryRepository::FindOpenDelivery(Transaction& t, std::uint32_t group_number) {
  const auto& s = TX(t).View();
  // newest open row wins if the invariant was ever broken externally
  for (auto it = s.deliveries.rbegin(); it != s.deliveries.rend(); ++it) {
    if (it->second.group_number == group_number && model::IsOpen(it->second.status)) return it->second;
  }
  return std::nullopt;
}

Result MemoryRepository::CreateDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_delivery_id++;
  s.deliveries[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.deliveries.contains(r.id)) return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
  s.deliveries[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeliveryRecord> MemoryRepository::GetDelivery(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.deliveries.find(id);
  if (it == s.deliveries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeliveryRecord> MemoryRepository::ListDeliveries(Transaction& t, const DeliveryFilter& filter, const Pagination& page) {
  const auto&                        s = TX(t).View();
  std::vector<model::DeliveryRecord> matched;
  for (const auto& [_, record] : s.deliveries) {
    if (Matches(record, filter)) matched.push_back(record);
  }

  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms > b.started_at_ms;
    return a.id > b.id;
  });

  if (page.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto last  = matched.end();
  if (page.limit > 0 && page.limit < matched.size() - page.offset) {
    last = first + static_cast<std::ptrdiff_t>(page.limit);
  }
  return {first, last};
}

std::uint64_t MemoryRepository::CountDeliveries(Transaction& t, const DeliveryFilter& filter) {
  const auto&   s     = TX(t).View();
  std::uint64_t count = 0;
  for (const auto& [_, record] : s.deliveries) {
    if (Matches(record, filter)) ++count;
  }
  return count;
}

Result MemoryRepository::InsertMaintenanceLog(Transaction& t, model::MaintenanceLogRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_log_id++;
  s.maintenance_log.push_back(r);
  return Result::Ok();
}

std::vector<model::MaintenanceLogRecord> MemoryRepository::ListMaintenanceLogs(Transaction& t, std::size_t limit) {
  const auto&                              s = TX(t).View();
  std::vector<model::MaintenanceLogRecord> out;
  for (auto it = s.maintenance_log.rbegin(); it != s.maintenance_log.rend(); ++it) {
    if (limit > 0 && out.size() >= limit) break;
    out.push_back(*it);
  }
  return out;
}

} // namespace brewmon::db::memory
