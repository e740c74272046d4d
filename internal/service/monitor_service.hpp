#pragma once

#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>

#include "brewmon/v1.hpp"
#include "internal/monitor/cycle_report.hpp"
#include "service_context.hpp"

namespace brewmon::service {

/*
  Monitoring control surface: start/stop, status, on-demand cycles.

  Every cycle, whether requested over RPC or by the ticker, goes through
  RunCycleNow() so the status view sees them all.
*/
class MonitorService {
public:
  explicit MonitorService(ServiceContext ctx);

  brewmon::v1::StartMonitoringResponse StartMonitoring(const brewmon::v1::StartMonitoringRequest& req);

  brewmon::v1::StopMonitoringResponse StopMonitoring(const brewmon::v1::StopMonitoringRequest& req);

  brewmon::v1::GetStatusResponse GetStatus(const brewmon::v1::GetStatusRequest& req);

  brewmon::v1::RunCycleResponse RunCycle(const brewmon::v1::RunCycleRequest& req);

  monitor::CycleReport RunCycleNow();

  // Writes a connection_issue maintenance entry. Never throws.
  void RecordCycleError(const std::exception& error);

private:
  brewmon::v1::MonitorStatus BuildStatus();
  // Best effort; a store failure is logged, the flag change stands.
  void WriteHealthCheck(const std::string& message);

  ServiceContext ctx_;

  std::mutex                          mutex_;
  std::optional<monitor::CycleReport> last_report_;
  std::optional<util::TimePoint>      last_cycle_at_;
  std::uint64_t                       cycles_completed_ = 0;
  std::uint64_t                       cycles_skipped_   = 0;
};

brewmon::v1::CycleReport ToProto(const monitor::CycleReport& report);

}
