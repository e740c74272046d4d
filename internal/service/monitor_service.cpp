#include "monitor_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/monitor/delivery_tracker.hpp"
#include "internal/monitor/monitoring_flag.hpp"
#include "internal/monitor/poll_cycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "rpc_observer.hpp"

namespace brewmon::service {

using namespace brewmon::v1;
using observability::StringField;

namespace {

brewmon::v1::CycleOutcome ToProto(monitor::CycleOutcome outcome) {
  switch (outcome) {
    case monitor::CycleOutcome::kDisabled:
      return CYCLE_OUTCOME_DISABLED;
    case monitor::CycleOutcome::kSkipped:
      return CYCLE_OUTCOME_SKIPPED;
    case monitor::CycleOutcome::kCompleted:
      return CYCLE_OUTCOME_COMPLETED;
    case monitor::CycleOutcome::kDisconnected:
      return CYCLE_OUTCOME_DISCONNECTED;
  }
  return CYCLE_OUTCOME_UNSPECIFIED;
}

brewmon::v1::ActivityType ToProto(monitor::ActivityType type) {
  switch (type) {
    case monitor::ActivityType::kDeliveryStarted:
      return ACTIVITY_TYPE_DELIVERY_STARTED;
    case monitor::ActivityType::kDeliveryCompleted:
      return ACTIVITY_TYPE_DELIVERY_COMPLETED;
    case monitor::ActivityType::kDeliveryFailed:
      return ACTIVITY_TYPE_DELIVERY_FAILED;
    case monitor::ActivityType::kError:
      return ACTIVITY_TYPE_ERROR;
  }
  return ACTIVITY_TYPE_UNSPECIFIED;
}

} // namespace

brewmon::v1::CycleReport ToProto(const monitor::CycleReport& report) {
  brewmon::v1::CycleReport out;
  out.set_outcome(ToProto(report.outcome));
  *out.mutable_timestamp() = util::ToProto(report.timestamp);
  out.set_open_deliveries(static_cast<uint32_t>(report.open_deliveries));
  for (const auto& activity : report.activities) {
    auto* a = out.add_activities();
    a->set_type(ToProto(activity.type));
    a->set_group_number(activity.group_number);
    a->set_coffee_type(activity.coffee_type);
    a->set_delivery_id(activity.delivery_id);
    a->set_message(activity.message);
  }
  return out;
}

MonitorService::MonitorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartMonitoringResponse MonitorService::StartMonitoring(const StartMonitoringRequest&) {
  return ObserveRpc("MonitorService.StartMonitoring", [&] {
    if (ctx_.flag->Enable()) {
      BREWMON_LOG_INFO("button press monitoring started");
      WriteHealthCheck("Button press monitoring started");
    } else {
      BREWMON_LOG_DEBUG("button press monitoring already running");
    }

    StartMonitoringResponse resp;
    *resp.mutable_status() = BuildStatus();
    return resp;
  });
}

StopMonitoringResponse MonitorService::StopMonitoring(const StopMonitoringRequest&) {
  return ObserveRpc("MonitorService.StopMonitoring", [&] {
    if (ctx_.flag->Disable()) {
      BREWMON_LOG_INFO("button press monitoring stopped");
      WriteHealthCheck("Button press monitoring stopped");
    } else {
      BREWMON_LOG_DEBUG("button press monitoring already stopped");
    }

    StopMonitoringResponse resp;
    *resp.mutable_status() = BuildStatus();
    return resp;
  });
}

GetStatusResponse MonitorService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("MonitorService.GetStatus", [&] {
    GetStatusResponse resp;
    *resp.mutable_status() = BuildStatus();
    return resp;
  });
}

RunCycleResponse MonitorService::RunCycle(const RunCycleRequest&) {
  return ObserveRpc("MonitorService.RunCycle", [&] {
    RunCycleResponse resp;
    *resp.mutable_report() = ToProto(RunCycleNow());
    return resp;
  });
}

monitor::CycleReport MonitorService::RunCycleNow() {
  auto report = ctx_.poll_cycle->Run();

  std::scoped_lock lock(mutex_);
  switch (report.outcome) {
    case monitor::CycleOutcome::kSkipped:
      ++cycles_skipped_;
      return report;
    case monitor::CycleOutcome::kDisabled:
      return report;
    case monitor::CycleOutcome::kCompleted:
      ++cycles_completed_;
      break;
    case monitor::CycleOutcome::kDisconnected:
      break;
  }
  last_cycle_at_ = report.timestamp;
  last_report_   = report;
  return report;
}

void MonitorService::RecordCycleError(const std::exception& error) {
  try {
    auto                           tx = ctx_.repository->Begin();
    db::model::MaintenanceLogRecord entry;
    entry.log_type      = db::model::kLogConnectionIssue;
    entry.message       = std::string("Monitoring error: ") + error.what();
    entry.created_at_ms = util::NowMillis();
    auto result         = ctx_.repository->InsertMaintenanceLog(*tx, entry);
    if (!result) {
      BREWMON_LOG_ERROR("cannot record monitoring error", {StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    BREWMON_LOG_ERROR("cannot record monitoring error", {StringField("error", e.what())});
  }
}

MonitorStatus MonitorService::BuildStatus() {
  MonitorStatus status;
  status.set_enabled(ctx_.flag->IsEnabled());
  for (auto group : ctx_.poll_cycle->KnownGroups()) {
    status.add_known_groups(group);
  }

  try {
    status.set_open_deliveries(static_cast<uint32_t>(ctx_.tracker->CountOpenManual()));
  } catch (const util::RecordStoreWriteFailed& e) {
    BREWMON_LOG_WARN("open delivery count unavailable", {StringField("error", e.what())});
  }

  std::scoped_lock lock(mutex_);
  if (last_cycle_at_) {
    *status.mutable_last_cycle_at() = util::ToProto(*last_cycle_at_);
  }
  if (last_report_) {
    *status.mutable_last_report() = ToProto(*last_report_);
  }
  status.set_cycles_completed(cycles_completed_);
  status.set_cycles_skipped(cycles_skipped_);
  return status;
}

void MonitorService::WriteHealthCheck(const std::string& message) {
  try {
    auto                            tx = ctx_.repository->Begin();
    db::model::MaintenanceLogRecord entry;
    entry.log_type      = db::model::kLogHealthCheck;
    entry.message       = message;
    entry.resolved      = true;
    entry.created_at_ms = util::NowMillis();
    auto result         = ctx_.repository->InsertMaintenanceLog(*tx, entry);
    if (!result) {
      BREWMON_LOG_WARN("cannot record health check", {StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    BREWMON_LOG_WARN("cannot record health check", {StringField("error", e.what())});
  }
}

} // namespace brewmon::service
