#include "internal/db/memory/memory_repository.hpp"
#include "internal/hardware/simulated_register_reader.hpp"
#include "internal/monitor/poll_cycle.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace {

using brewmon::db::DeliveryFilter;
using brewmon::db::Pagination;
using brewmon::db::memory::MemoryRepository;
using brewmon::db::model::DeliveryRecord;
using brewmon::hardware::SimulatedRegisterReader;
using brewmon::monitor::ActivityType;
using brewmon::monitor::CycleOutcome;
using brewmon::monitor::DeliveryTracker;
using brewmon::monitor::MonitoringFlag;
using brewmon::monitor::PollCycle;
using brewmon::monitor::TransitionDetector;
using brewmon::util::TimePoint;
using namespace brewmon::v1;

struct Rig {
  std::shared_ptr<MemoryRepository>        repository;
  std::shared_ptr<SimulatedRegisterReader> reader;
  std::shared_ptr<MonitoringFlag>          flag;
  std::shared_ptr<TransitionDetector>      detector;
  std::shared_ptr<PollCycle>               cycle;
};

Rig MakeRig(uint32_t groups, bool enabled, SimulatedRegisterReader::ClockFn clock = {}) {
  Rig rig;
  rig.repository = std::make_shared<MemoryRepository>();
  rig.reader     = std::make_shared<SimulatedRegisterReader>(groups, std::move(clock));
  rig.flag       = std::make_shared<MonitoringFlag>(enabled);
  rig.detector   = std::make_shared<TransitionDetector>(rig.reader);
  auto tracker   = std::make_shared<DeliveryTracker>(rig.repository);
  rig.cycle      = std::make_shared<PollCycle>(rig.flag, rig.reader, rig.detector, tracker, groups);
  return rig;
}

std::vector<DeliveryRecord> AllDeliveries(MemoryRepository& repo) {
  auto tx      = repo.Begin();
  auto records = repo.ListDeliveries(*tx, DeliveryFilter{}, Pagination{});
  tx->Rollback();
  return records;
}

void TestUnchangedSnapshotNeverTouchesRecords() {
  auto rig = MakeRig(1, true);

  for (int i = 0; i < 5; ++i) {
    auto report = rig.cycle->Run();
    assert(report.outcome == CycleOutcome::kCompleted);
    assert(report.activities.empty());
  }
  assert(AllDeliveries(*rig.repository).empty());

  // steady activity after the start: still one record, never mutated
  assert(rig.cycle->Run().activities.empty());
  rig.reader->SetDelivering(1, "single_long");
  assert(rig.cycle->Run().activities.size() == 1);
  const auto before = AllDeliveries(*rig.repository);
  for (int i = 0; i < 5; ++i) {
    assert(rig.cycle->Run().activities.empty());
  }
  const auto after = AllDeliveries(*rig.repository);
  assert(after.size() == 1);
  assert(after[0].status == before[0].status);
  assert(after[0].completed_at_ms == before[0].completed_at_ms);
}

void TestOneActivityProducesOneRecord() {
  TimePoint now{std::chrono::milliseconds(1'000)};
  auto      rig = MakeRig(1, true, [&now] { return now; });

  const TimePoint t1{std::chrono::milliseconds(1'000)};
  const TimePoint t2{std::chrono::milliseconds(3'000)};
  const TimePoint t3{std::chrono::milliseconds(5'000)};
  const TimePoint t4{std::chrono::milliseconds(7'000)};

  now = t1;
  rig.reader->SetIdle(1);
  assert(rig.cycle->Run().activities.empty());

  now = t2;
  rig.reader->SetDelivering(1, "double_medium");
  auto started = rig.cycle->Run();
  assert(started.activities.size() == 1);
  assert(started.activities[0].type == ActivityType::kDeliveryStarted);
  assert(started.activities[0].group_number == 1);
  assert(started.open_deliveries == 1);

  now = t3;
  assert(rig.cycle->Run().activities.empty());

  now = t4;
  rig.reader->SetIdle(1);
  auto completed = rig.cycle->Run();
  assert(completed.activities.size() == 1);
  assert(completed.activities[0].type == ActivityType::kDeliveryCompleted);
  assert(completed.activities[0].delivery_id == started.activities[0].delivery_id);
  assert(completed.open_deliveries == 0);

  auto records = AllDeliveries(*rig.repository);
  assert(records.size() == 1);
  assert(records[0].group_number == 1);
  assert(records[0].trigger_type == TRIGGER_TYPE_MANUAL);
  assert(records[0].status == DELIVERY_STATUS_COMPLETED);
  assert(records[0].coffee_type == "double_medium");
  assert(records[0].started_at_ms == brewmon::util::ToUnixMillis(t2));
  assert(records[0].completed_at_ms == brewmon::util::ToUnixMillis(t4));
}

void TestActivityBetweenSamplesIsMissed() {
  auto rig = MakeRig(1, true);

  assert(rig.cycle->Run().activities.empty());

  // starts and ends between two cycles
  rig.reader->SetDelivering(1, "single_short");
  rig.reader->SetIdle(1);

  auto report = rig.cycle->Run();
  assert(report.outcome == CycleOutcome::kCompleted);
  assert(report.activities.empty());
  assert(AllDeliveries(*rig.repository).empty());
}

void TestDisabledFlagGatesDetection() {
  auto rig = MakeRig(1, true);
  assert(rig.cycle->Run().activities.empty());

  rig.flag->Disable();
  const auto reads_before = rig.reader->ReadCount();

  rig.reader->SetDelivering(1, "double_short");
  for (int i = 0; i < 3; ++i) {
    auto report = rig.cycle->Run();
    assert(report.outcome == CycleOutcome::kDisabled);
    assert(report.activities.empty());
  }
  assert(rig.reader->ReadCount() == reads_before);
  assert(AllDeliveries(*rig.repository).empty());

  // re-enabled while active: the first read is a fresh baseline, not a
  // start compared against the idle pre-disable snapshot
  rig.flag->Enable();
  auto first = rig.cycle->Run();
  assert(first.outcome == CycleOutcome::kCompleted);
  assert(first.activities.empty());
  assert(AllDeliveries(*rig.repository).empty());

  rig.reader->SetIdle(1);
  rig.reader->SetDelivering(1, "single_long");
  (void)rig.cycle->Run();
  assert(AllDeliveries(*rig.repository).empty());
}

void TestDisableDoesNotAlterOpenRecord() {
  auto rig = MakeRig(1, true);
  (void)rig.cycle->Run();

  rig.reader->SetDelivering(1, "double_long");
  assert(rig.cycle->Run().activities.size() == 1);

  rig.flag->Disable();
  rig.reader->SetIdle(1);
  assert(rig.cycle->Run().outcome == CycleOutcome::kDisabled);

  auto records = AllDeliveries(*rig.repository);
  assert(records.size() == 1);
  assert(records[0].status == DELIVERY_STATUS_STARTED);
}

void TestEnableMidActivityCompletesRetroactively() {
  auto rig = MakeRig(1, false);
  rig.reader->SetDelivering(1, "purge");

  rig.flag->Enable();
  assert(rig.cycle->Run().activities.empty());

  rig.reader->SetIdle(1);
  auto report = rig.cycle->Run();
  assert(report.activities.size() == 1);
  assert(report.activities[0].type == ActivityType::kDeliveryCompleted);
  assert(report.activities[0].coffee_type == "purge");

  auto records = AllDeliveries(*rig.repository);
  assert(records.size() == 1);
  assert(records[0].status == DELIVERY_STATUS_COMPLETED);
  assert(records[0].retroactive);
  assert(records[0].started_at_ms == records[0].completed_at_ms);
}

void TestOverlappingCycleIsSkipped() {
  auto rig = MakeRig(1, true);
  assert(rig.cycle->Run().outcome == CycleOutcome::kCompleted);

  rig.reader->SetDelivering(1, "single_medium");
  rig.reader->Block();

  brewmon::monitor::CycleReport first;
  std::thread                   runner([&] { first = rig.cycle->Run(); });

  while (rig.reader->BlockedReads() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  assert(rig.cycle->InProgress());

  const auto reads_before = rig.reader->ReadCount();
  const auto baseline     = rig.detector->LastSnapshot(1);

  auto second = rig.cycle->Run();
  assert(second.outcome == CycleOutcome::kSkipped);
  assert(second.activities.empty());
  assert(rig.reader->ReadCount() == reads_before);
  assert(rig.detector->LastSnapshot(1)->IsActive() == baseline->IsActive());

  rig.reader->Release();
  runner.join();

  assert(first.outcome == CycleOutcome::kCompleted);
  assert(first.activities.size() == 1);
  assert(!rig.cycle->InProgress());
  assert(AllDeliveries(*rig.repository).size() == 1);

  // guard released: the next cycle scans again
  assert(rig.cycle->Run().outcome == CycleOutcome::kCompleted);
}

void TestFailingGroupIsIsolated() {
  auto rig = MakeRig(2, true);
  (void)rig.cycle->Run();

  rig.reader->SetGroupAvailable(2, false);
  rig.reader->SetDelivering(1, "double_short");

  auto report = rig.cycle->Run();
  assert(report.outcome == CycleOutcome::kCompleted);
  assert(report.activities.size() == 2);

  bool saw_start = false;
  bool saw_error = false;
  for (const auto& activity : report.activities) {
    if (activity.type == ActivityType::kDeliveryStarted && activity.group_number == 1) saw_start = true;
    if (activity.type == ActivityType::kError && activity.group_number == 2) saw_error = true;
  }
  assert(saw_start && saw_error);
}

void TestAllReadsFailingIsDisconnected() {
  auto rig = MakeRig(2, true);
  (void)rig.cycle->Run();

  rig.reader->SetDelivering(1, "single_short");
  assert(rig.cycle->Run().open_deliveries == 1);

  rig.reader->SetAvailable(false);
  auto report = rig.cycle->Run();
  assert(report.outcome == CycleOutcome::kDisconnected);

  bool saw_failed = false;
  for (const auto& activity : report.activities) {
    if (activity.type == ActivityType::kDeliveryFailed) {
      saw_failed = true;
      assert(activity.group_number == 1);
      assert(activity.message == "hardware unavailable");
    }
  }
  assert(saw_failed);
  assert(report.open_deliveries == 0);
}

void TestReadFailureMidDeliveryKeepsOneRecord() {
  auto rig = MakeRig(1, true);
  (void)rig.cycle->Run();

  rig.reader->SetDelivering(1, "single_short");
  assert(rig.cycle->Run().activities.size() == 1);

  rig.reader->SetAvailable(false);
  assert(rig.cycle->Run().outcome == CycleOutcome::kDisconnected);

  rig.reader->SetAvailable(true);
  rig.reader->SetIdle(1);
  auto recovered = rig.cycle->Run();
  assert(recovered.outcome == CycleOutcome::kCompleted);
  assert(recovered.activities.empty());

  auto records = AllDeliveries(*rig.repository);
  assert(records.size() == 1);
  assert(records[0].status == DELIVERY_STATUS_FAILED);
  assert(records[0].error_message == "hardware unavailable");
  assert(records[0].completed_at_ms != 0);
  assert(!records[0].retroactive);

  // the next brew gets its own record
  rig.reader->SetDelivering(1, "double_short");
  assert(rig.cycle->Run().activities[0].type == ActivityType::kDeliveryStarted);
  rig.reader->SetIdle(1);
  assert(rig.cycle->Run().activities[0].type == ActivityType::kDeliveryCompleted);
  assert(AllDeliveries(*rig.repository).size() == 2);
}

void TestRestartAfterStoppedDeliveryClosesIt() {
  auto rig = MakeRig(1, true);
  (void)rig.cycle->Run();

  rig.reader->SetDelivering(1, "single_short");
  const auto started = rig.cycle->Run();
  assert(started.activities.size() == 1);

  rig.flag->Disable();
  rig.reader->SetIdle(1);
  assert(rig.cycle->Run().outcome == CycleOutcome::kDisabled);
  assert(AllDeliveries(*rig.repository)[0].status == DELIVERY_STATUS_STARTED);

  rig.flag->Enable();
  auto baseline = rig.cycle->Run();
  assert(baseline.activities.size() == 1);
  assert(baseline.activities[0].type == ActivityType::kDeliveryCompleted);
  assert(baseline.activities[0].delivery_id == started.activities[0].delivery_id);
  assert(baseline.open_deliveries == 0);

  rig.reader->SetDelivering(1, "double_long");
  auto second = rig.cycle->Run();
  assert(second.activities.size() == 1);
  assert(second.activities[0].type == ActivityType::kDeliveryStarted);
  assert(second.activities[0].coffee_type == "double_long");

  rig.reader->SetIdle(1);
  auto done = rig.cycle->Run();
  assert(done.activities.size() == 1);
  assert(done.activities[0].delivery_id == second.activities[0].delivery_id);

  auto records = AllDeliveries(*rig.repository);
  assert(records.size() == 2);
  for (const auto& record : records) {
    assert(record.status == DELIVERY_STATUS_COMPLETED);
    if (record.coffee_type == "single_short") {
      assert(record.retroactive);
    } else {
      assert(record.coffee_type == "double_long");
      assert(!record.retroactive);
    }
  }
}

// Delegates to a simulated bank and checks reads happen inside a cycle.
class BracketCheckingReader final : public brewmon::hardware::RegisterReader {
 public:
  explicit BracketCheckingReader(std::shared_ptr<SimulatedRegisterReader> inner) : inner_(std::move(inner)) {
  }

  brewmon::hardware::RegisterSnapshot Read(uint32_t group_id) override {
    assert(in_cycle);
    return inner_->Read(group_id);
  }
  std::optional<uint32_t> GroupCount() override {
    return inner_->GroupCount();
  }
  void BeginCycle() override {
    assert(!in_cycle);
    in_cycle = true;
    ++cycles;
  }
  void EndCycle() override {
    assert(in_cycle);
    in_cycle = false;
  }

  bool in_cycle = false;
  int  cycles   = 0;

 private:
  std::shared_ptr<SimulatedRegisterReader> inner_;
};

void TestReadsAreBracketedPerCycle() {
  auto bank    = std::make_shared<SimulatedRegisterReader>(2);
  auto reader  = std::make_shared<BracketCheckingReader>(bank);
  auto flag    = std::make_shared<MonitoringFlag>(true);
  auto tracker = std::make_shared<DeliveryTracker>(std::make_shared<MemoryRepository>());
  PollCycle cycle(flag, reader, std::make_shared<TransitionDetector>(reader), tracker, 2);

  (void)cycle.Run();
  bank->SetDelivering(2, "single_medium");
  assert(cycle.Run().activities.size() == 1);
  assert(reader->cycles == 2);
  assert(!reader->in_cycle);

  // gated cycles never open one
  flag->Disable();
  (void)cycle.Run();
  assert(reader->cycles == 2);
}

void TestKnownGroups() {
  auto configured = MakeRig(2, true);
  assert(configured.cycle->KnownGroups() == (std::vector<uint32_t>{1, 2}));

  auto repository = std::make_shared<MemoryRepository>();
  auto flag       = std::make_shared<MonitoringFlag>(true);
  auto tracker    = std::make_shared<DeliveryTracker>(repository);

  // reader reports 4 groups, nothing configured
  auto reported = std::make_shared<SimulatedRegisterReader>(4);
  PollCycle from_reader(flag, reported, std::make_shared<TransitionDetector>(reported), tracker, 0);
  assert(from_reader.KnownGroups().size() == 4);

  // reader does not know; default applies
  auto silent = std::make_shared<SimulatedRegisterReader>();
  PollCycle fallback(flag, silent, std::make_shared<TransitionDetector>(silent), tracker, 0);
  assert(fallback.KnownGroups() == (std::vector<uint32_t>{1, 2, 3}));

  silent->SetAvailable(false);
  assert(fallback.KnownGroups().size() == brewmon::monitor::kDefaultGroupCount);

  // capped
  auto many = std::make_shared<SimulatedRegisterReader>(12);
  PollCycle capped(flag, many, std::make_shared<TransitionDetector>(many), tracker, 0);
  assert(capped.KnownGroups().size() == brewmon::monitor::kMaxGroupCount);
}

} // namespace

int main() {
  TestUnchangedSnapshotNeverTouchesRecords();
  TestOneActivityProducesOneRecord();
  TestActivityBetweenSamplesIsMissed();
  TestDisabledFlagGatesDetection();
  TestDisableDoesNotAlterOpenRecord();
  TestEnableMidActivityCompletesRetroactively();
  TestOverlappingCycleIsSkipped();
  TestFailingGroupIsIsolated();
  TestAllReadsFailingIsDisconnected();
  TestReadFailureMidDeliveryKeepsOneRecord();
  TestRestartAfterStoppedDeliveryClosesIt();
  TestReadsAreBracketedPerCycle();
  TestKnownGroups();

  std::cout << "brewmon_unit_poll_cycle: pass\n";
  return 0;
}
