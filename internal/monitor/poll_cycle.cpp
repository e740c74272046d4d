#include "poll_cycle.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace brewmon::monitor {

using observability::IntField;
using observability::StringField;

const char* CycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kDisabled:
      return "disabled";
    case CycleOutcome::kSkipped:
      return "skipped";
    case CycleOutcome::kCompleted:
      return "completed";
    case CycleOutcome::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

const char* ActivityTypeName(ActivityType type) {
  switch (type) {
    case ActivityType::kDeliveryStarted:
      return "delivery_started";
    case ActivityType::kDeliveryCompleted:
      return "delivery_completed";
    case ActivityType::kDeliveryFailed:
      return "delivery_failed";
    case ActivityType::kError:
      return "error";
  }
  return "unknown";
}

namespace {

class InProgressGuard {
 public:
  explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    acquired_     = flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }
  ~InProgressGuard() {
    if (acquired_) flag_.store(false, std::memory_order_release);
  }

  InProgressGuard(const InProgressGuard&)            = delete;
  InProgressGuard& operator=(const InProgressGuard&) = delete;

  bool Acquired() const {
    return acquired_;
  }

 private:
  std::atomic<bool>& flag_;
  bool               acquired_ = false;
};

class ReaderCycleScope {
 public:
  explicit ReaderCycleScope(hardware::RegisterReader& reader) : reader_(reader) {
    reader_.BeginCycle();
  }
  ~ReaderCycleScope() {
    reader_.EndCycle();
  }

  ReaderCycleScope(const ReaderCycleScope&)            = delete;
  ReaderCycleScope& operator=(const ReaderCycleScope&) = delete;

 private:
  hardware::RegisterReader& reader_;
};

CycleActivity FromRecord(ActivityType type, const db::model::DeliveryRecord& record) {
  CycleActivity activity;
  activity.type         = type;
  activity.group_number = record.group_number;
  activity.coffee_type  = record.coffee_type;
  activity.delivery_id  = record.id;
  return activity;
}

CycleActivity Error(std::uint32_t group, std::string message) {
  CycleActivity activity;
  activity.type         = ActivityType::kError;
  activity.group_number = group;
  activity.message      = std::move(message);
  return activity;
}

} // namespace

PollCycle::PollCycle(std::shared_ptr<MonitoringFlag> flag, std::shared_ptr<hardware::RegisterReader> reader,
                     std::shared_ptr<TransitionDetector> detector, std::shared_ptr<DeliveryTracker> tracker, std::uint32_t configured_group_count)
    : flag_(std::move(flag)),
      reader_(std::move(reader)),
      detector_(std::move(detector)),
      tracker_(std::move(tracker)),
      configured_group_count_(configured_group_count) {
}

std::vector<std::uint32_t> PollCycle::KnownGroups() {
  std::uint32_t count = configured_group_count_;
  if (count == 0) {
    try {
      count = reader_->GroupCount().value_or(kDefaultGroupCount);
    } catch (const util::HardwareUnavailable& e) {
      BREWMON_LOG_DEBUG("group count unavailable, using default", {StringField("error", e.what())});
      count = kDefaultGroupCount;
    }
  }
  if (count == 0) count = kDefaultGroupCount;
  count = std::min(count, kMaxGroupCount);

  std::vector<std::uint32_t> groups;
  for (std::uint32_t g = 1; g <= count; ++g) groups.push_back(g);
  return groups;
}

CycleReport PollCycle::Run() {
  CycleReport report;
  report.timestamp = util::Now();

  InProgressGuard guard(in_progress_);
  if (!guard.Acquired()) {
    report.outcome = CycleOutcome::kSkipped;
    BREWMON_LOG_DEBUG("poll cycle skipped, previous cycle still running");
    observability::Metrics::Instance().RecordCycle(CycleOutcomeName(report.outcome));
    return report;
  }

  const auto state = flag_->Load();
  if (!state.enabled) {
    report.outcome = CycleOutcome::kDisabled;
    observability::Metrics::Instance().RecordCycle(CycleOutcomeName(report.outcome));
    return report;
  }

  observability::SpanScope span("PollCycle.Run");
  const auto               started = std::chrono::steady_clock::now();

  if (state.epoch != last_epoch_) {
    detector_->Reset();
    last_epoch_ = state.epoch;
    BREWMON_LOG_INFO("monitoring epoch started, baselines cleared", {IntField("epoch", static_cast<std::int64_t>(state.epoch))});
  }

  ReaderCycleScope reader_cycle(*reader_);
  const auto       groups = KnownGroups();
  span.SetAttribute("groups", static_cast<std::int64_t>(groups.size()));

  std::size_t reads_ok = 0;
  for (auto group : groups) {
    bool read_ok = false;
    ScanGroup(group, report, read_ok);
    if (read_ok) ++reads_ok;
  }

  report.outcome = (reads_ok == 0 && !groups.empty()) ? CycleOutcome::kDisconnected : CycleOutcome::kCompleted;
  if (report.outcome == CycleOutcome::kDisconnected) {
    BREWMON_LOG_WARN("cannot monitor button presses, machine not connected");
  }

  try {
    report.open_deliveries = tracker_->CountOpenManual();
    observability::Metrics::Instance().SetOpenDeliveries(report.open_deliveries);
  } catch (const util::RecordStoreWriteFailed& e) {
    BREWMON_LOG_WARN("open delivery count unavailable", {StringField("error", e.what())});
  }

  if (!report.activities.empty()) {
    BREWMON_LOG_INFO("poll cycle activities", {IntField("count", static_cast<std::int64_t>(report.activities.size())),
                                              IntField("open_deliveries", static_cast<std::int64_t>(report.open_deliveries))});
  }

  span.SetAttribute("outcome", CycleOutcomeName(report.outcome));
  span.SetAttribute("activities", static_cast<std::int64_t>(report.activities.size()));
  observability::Metrics::Instance().RecordCycle(CycleOutcomeName(report.outcome));
  observability::Metrics::Instance().ObserveCycleDurationMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
  return report;
}

void PollCycle::ScanGroup(std::uint32_t group, CycleReport& report, bool& read_ok) {
  try {
    const auto event = detector_->Observe(group);
    read_ok          = event.kind != TransitionKind::kReadFailed;

    if (event.kind == TransitionKind::kReadFailed) {
      BREWMON_LOG_WARN("group read failed", {IntField("group", group), StringField("error", event.error)});
      report.activities.push_back(Error(group, event.error));
    }

    const auto outcome = tracker_->Apply(event);
    switch (outcome.action) {
      case TrackerAction::kCreated:
        report.activities.push_back(FromRecord(ActivityType::kDeliveryStarted, *outcome.record));
        observability::Metrics::Instance().RecordDeliveryEvent(ActivityTypeName(ActivityType::kDeliveryStarted), group);
        break;
      case TrackerAction::kCompleted:
      case TrackerAction::kRetroactive:
      case TrackerAction::kReconciled:
        report.activities.push_back(FromRecord(ActivityType::kDeliveryCompleted, *outcome.record));
        observability::Metrics::Instance().RecordDeliveryEvent(ActivityTypeName(ActivityType::kDeliveryCompleted), group);
        break;
      case TrackerAction::kFailed:
        report.activities.push_back(FromRecord(ActivityType::kDeliveryFailed, *outcome.record));
        report.activities.back().message = outcome.record->error_message;
        observability::Metrics::Instance().RecordDeliveryEvent(ActivityTypeName(ActivityType::kDeliveryFailed), group);
        break;
      case TrackerAction::kFailureEnded:  // reported as failed by the earlier cycle
      case TrackerAction::kDuplicate:
      case TrackerAction::kNotOwned:
      case TrackerAction::kNone:
        break;
    }
  } catch (const util::RecordStoreWriteFailed& e) {
    // last snapshot already advanced; the event is not retried
    BREWMON_LOG_WARN("record store write failed", {IntField("group", group), StringField("error", e.what())});
    report.activities.push_back(Error(group, e.what()));
  } catch (const std::exception& e) {
    BREWMON_LOG_ERROR("error monitoring group", {IntField("group", group), StringField("error", e.what())});
    report.activities.push_back(Error(group, e.what()));
  }
}

} // namespace brewmon::monitor
