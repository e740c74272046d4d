#include "internal/db/memory/memory_repository.hpp"
#include "internal/hardware/simulated_register_reader.hpp"
#include "internal/monitor/delivery_tracker.hpp"
#include "internal/monitor/monitoring_flag.hpp"
#include "internal/monitor/poll_cycle.hpp"
#include "internal/monitor/transition_detector.hpp"
#include "internal/service/monitor_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using brewmon::db::memory::MemoryRepository;
using brewmon::hardware::SimulatedRegisterReader;
using namespace brewmon::v1;

struct Fixture {
  std::shared_ptr<MemoryRepository>             repository;
  std::shared_ptr<SimulatedRegisterReader>      reader;
  brewmon::service::ServiceContext              ctx;
  std::shared_ptr<brewmon::service::MonitorService> service;
};

Fixture MakeFixture(bool enabled) {
  Fixture f;
  f.repository = std::make_shared<MemoryRepository>();
  f.reader     = std::make_shared<SimulatedRegisterReader>(2);

  f.ctx.repository = f.repository;
  f.ctx.flag       = std::make_shared<brewmon::monitor::MonitoringFlag>(enabled);
  f.ctx.tracker    = std::make_shared<brewmon::monitor::DeliveryTracker>(f.repository);
  f.ctx.poll_cycle = std::make_shared<brewmon::monitor::PollCycle>(
      f.ctx.flag, f.reader, std::make_shared<brewmon::monitor::TransitionDetector>(f.reader), f.ctx.tracker, 0);

  f.service = std::make_shared<brewmon::service::MonitorService>(f.ctx);
  return f;
}

std::vector<brewmon::db::model::MaintenanceLogRecord> Logs(MemoryRepository& repo) {
  auto tx      = repo.Begin();
  auto entries = repo.ListMaintenanceLogs(*tx, 100);
  tx->Rollback();
  return entries;
}

void TestStartAndStopToggleFlagAndLogOnce() {
  auto f = MakeFixture(false);

  auto started = f.service->StartMonitoring(StartMonitoringRequest{});
  assert(started.status().enabled());
  assert(f.ctx.flag->IsEnabled());

  // second start is a no-op
  (void)f.service->StartMonitoring(StartMonitoringRequest{});
  auto logs = Logs(*f.repository);
  assert(logs.size() == 1);
  assert(logs[0].log_type == brewmon::db::model::kLogHealthCheck);
  assert(logs[0].message == "Button press monitoring started");
  assert(logs[0].resolved);

  auto stopped = f.service->StopMonitoring(StopMonitoringRequest{});
  assert(!stopped.status().enabled());
  (void)f.service->StopMonitoring(StopMonitoringRequest{});

  logs = Logs(*f.repository);
  assert(logs.size() == 2);
  assert(logs[0].message == "Button press monitoring stopped");
}

void TestStatusReportsGroupsAndLastCycle() {
  auto f = MakeFixture(true);

  auto before = f.service->GetStatus(GetStatusRequest{}).status();
  assert(before.enabled());
  assert(before.known_groups_size() == 2);
  assert(before.known_groups(0) == 1);
  assert(before.known_groups(1) == 2);
  assert(!before.has_last_cycle_at());
  assert(before.cycles_completed() == 0);

  (void)f.service->RunCycle(RunCycleRequest{});
  f.reader->SetDelivering(2, "double_short");
  auto run = f.service->RunCycle(RunCycleRequest{});
  assert(run.report().outcome() == CYCLE_OUTCOME_COMPLETED);
  assert(run.report().activities_size() == 1);
  assert(run.report().activities(0).type() == ACTIVITY_TYPE_DELIVERY_STARTED);
  assert(run.report().activities(0).group_number() == 2);
  assert(run.report().activities(0).coffee_type() == "double_short");
  assert(run.report().open_deliveries() == 1);

  auto after = f.service->GetStatus(GetStatusRequest{}).status();
  assert(after.has_last_cycle_at());
  assert(after.cycles_completed() == 2);
  assert(after.open_deliveries() == 1);
  assert(after.last_report().activities_size() == 1);
}

void TestDisabledCycleDoesNotUpdateLastCycle() {
  auto f = MakeFixture(false);

  auto run = f.service->RunCycle(RunCycleRequest{});
  assert(run.report().outcome() == CYCLE_OUTCOME_DISABLED);

  auto status = f.service->GetStatus(GetStatusRequest{}).status();
  assert(!status.has_last_cycle_at());
  assert(status.cycles_completed() == 0);
}

void TestSkippedCycleIsCounted() {
  auto f = MakeFixture(true);
  f.reader->Block();

  std::thread runner([&] { (void)f.service->RunCycleNow(); });
  while (f.reader->BlockedReads() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  auto skipped = f.service->RunCycle(RunCycleRequest{});
  assert(skipped.report().outcome() == CYCLE_OUTCOME_SKIPPED);

  f.reader->Release();
  runner.join();

  auto status = f.service->GetStatus(GetStatusRequest{}).status();
  assert(status.cycles_skipped() == 1);
  assert(status.cycles_completed() == 1);
}

void TestCycleErrorIsRecorded() {
  auto f = MakeFixture(true);
  f.service->RecordCycleError(std::runtime_error("ticker stalled"));

  auto logs = Logs(*f.repository);
  assert(logs.size() == 1);
  assert(logs[0].log_type == brewmon::db::model::kLogConnectionIssue);
  assert(logs[0].message == "Monitoring error: ticker stalled");
  assert(!logs[0].resolved);
}

void TestDisconnectedCycleKeepsCompletedCount() {
  auto f = MakeFixture(true);
  f.reader->SetAvailable(false);

  auto report = f.service->RunCycleNow();
  assert(report.outcome == brewmon::monitor::CycleOutcome::kDisconnected);

  auto status = f.service->GetStatus(GetStatusRequest{}).status();
  assert(status.cycles_completed() == 0);
  assert(status.has_last_cycle_at());
  assert(status.last_report().outcome() == CYCLE_OUTCOME_DISCONNECTED);
}

} // namespace

int main() {
  TestStartAndStopToggleFlagAndLogOnce();
  TestStatusReportsGroupsAndLastCycle();
  TestDisabledCycleDoesNotUpdateLastCycle();
  TestSkippedCycleIsCounted();
  TestCycleErrorIsRecorded();
  TestDisconnectedCycleKeepsCompletedCount();

  std::cout << "brewmon_unit_monitor_service: pass\n";
  return 0;
}
