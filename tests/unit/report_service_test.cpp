#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/report_service.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <memory>

namespace {

using brewmon::db::memory::MemoryRepository;
using brewmon::db::model::DeliveryRecord;
using namespace brewmon::v1;

std::shared_ptr<MemoryRepository> SeedRepository() {
  auto repo = std::make_shared<MemoryRepository>();
  auto tx   = repo->Begin();

  auto add = [&](uint32_t group, DeliveryStatus status, TriggerType trigger, uint64_t started_at_ms) {
    DeliveryRecord record;
    record.coffee_type     = "double_short";
    record.group_number    = group;
    record.status          = status;
    record.trigger_type    = trigger;
    record.started_at_ms   = started_at_ms;
    record.completed_at_ms = status == DELIVERY_STATUS_COMPLETED ? started_at_ms + 20'000 : 0;
    assert(repo->CreateDelivery(*tx, record));
  };

  add(1, DELIVERY_STATUS_COMPLETED, TRIGGER_TYPE_MANUAL, 1'000);
  add(1, DELIVERY_STATUS_COMPLETED, TRIGGER_TYPE_MANUAL, 2'000);
  add(2, DELIVERY_STATUS_FAILED, TRIGGER_TYPE_MANUAL, 3'000);
  add(2, DELIVERY_STATUS_STARTED, TRIGGER_TYPE_MANUAL, 4'000);
  add(1, DELIVERY_STATUS_COMPLETED, TRIGGER_TYPE_API, 5'000);

  brewmon::db::model::MaintenanceLogRecord entry;
  entry.log_type      = brewmon::db::model::kLogManualDelivery;
  entry.group_number  = 2;
  entry.message       = "Manual double_short delivery started via physical button on group 2";
  entry.created_at_ms = 4'000;
  assert(repo->InsertMaintenanceLog(*tx, entry));

  tx->Commit();
  return repo;
}

brewmon::service::ReportService MakeService(std::shared_ptr<MemoryRepository> repo) {
  brewmon::service::ServiceContext ctx;
  ctx.repository = std::move(repo);
  return brewmon::service::ReportService(ctx);
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const brewmon::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestListsOnlyManualDeliveriesNewestFirst() {
  auto service = MakeService(SeedRepository());

  auto resp = service.ListManualDeliveries(ListManualDeliveriesRequest{});
  assert(resp.total_count() == 4);
  assert(resp.deliveries_size() == 4);
  assert(resp.deliveries(0).started_at().seconds() == 4);
  assert(resp.deliveries(3).started_at().seconds() == 1);
  for (const auto& delivery : resp.deliveries()) {
    assert(delivery.trigger_type() == TRIGGER_TYPE_MANUAL);
  }

  // open delivery has no completion time
  assert(!resp.deliveries(0).has_completed_at());
  assert(resp.deliveries(1).has_completed_at());
}

void TestFiltersByGroupAndStatus() {
  auto service = MakeService(SeedRepository());

  ListManualDeliveriesRequest by_group;
  by_group.set_group_number(1);
  auto group1 = service.ListManualDeliveries(by_group);
  assert(group1.total_count() == 2);

  ListManualDeliveriesRequest by_status;
  by_status.set_status(DELIVERY_STATUS_FAILED);
  auto failed = service.ListManualDeliveries(by_status);
  assert(failed.total_count() == 1);
  assert(failed.deliveries(0).group_number() == 2);
}

void TestPaginationKeepsTotalCount() {
  auto service = MakeService(SeedRepository());

  ListManualDeliveriesRequest req;
  req.set_limit(3);
  req.set_offset(2);
  auto page = service.ListManualDeliveries(req);
  assert(page.deliveries_size() == 2);
  assert(page.total_count() == 4);
}

void TestRejectsInvalidRequests() {
  auto service = MakeService(SeedRepository());

  ListManualDeliveriesRequest bad_group;
  bad_group.set_group_number(5);
  assert(ThrowsInvalidArgument([&] { (void)service.ListManualDeliveries(bad_group); }));

  ListManualDeliveriesRequest too_many;
  too_many.set_limit(brewmon::service::kMaxPageSize + 1);
  assert(ThrowsInvalidArgument([&] { (void)service.ListManualDeliveries(too_many); }));

  ListManualDeliveriesRequest bad_status;
  bad_status.set_status(static_cast<DeliveryStatus>(42));
  assert(ThrowsInvalidArgument([&] { (void)service.ListManualDeliveries(bad_status); }));

  ListMaintenanceLogsRequest too_many_logs;
  too_many_logs.set_limit(brewmon::service::kMaxPageSize + 1);
  assert(ThrowsInvalidArgument([&] { (void)service.ListMaintenanceLogs(too_many_logs); }));
}

void TestListsMaintenanceLog() {
  auto service = MakeService(SeedRepository());

  auto resp = service.ListMaintenanceLogs(ListMaintenanceLogsRequest{});
  assert(resp.entries_size() == 1);
  assert(resp.entries(0).log_type() == "manual_delivery");
  assert(resp.entries(0).group_number() == 2);
  assert(resp.entries(0).created_at().seconds() == 4);
}

} // namespace

int main() {
  TestListsOnlyManualDeliveriesNewestFirst();
  TestFiltersByGroupAndStatus();
  TestPaginationKeepsTotalCount();
  TestRejectsInvalidRequests();
  TestListsMaintenanceLog();

  std::cout << "brewmon_unit_report_service: pass\n";
  return 0;
}
