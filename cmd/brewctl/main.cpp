#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "brewmon/v1.hpp"

using namespace brewmon::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  brewctl <addr> start\n"
            << "  brewctl <addr> stop\n"
            << "  brewctl <addr> status\n"
            << "  brewctl <addr> cycle\n"
            << "  brewctl <addr> deliveries [group] [status=started|in_progress|completed|failed]\n"
            << "  brewctl <addr> logs [limit]\n"
            << "  brewctl <addr> watch <duration_s> [interval_s]\n";
}

static std::optional<DeliveryStatus> ParseStatus(const std::string& value) {
  if (value == "started") return DELIVERY_STATUS_STARTED;
  if (value == "in_progress") return DELIVERY_STATUS_IN_PROGRESS;
  if (value == "completed") return DELIVERY_STATUS_COMPLETED;
  if (value == "failed") return DELIVERY_STATUS_FAILED;
  return std::nullopt;
}

static std::optional<uint64_t> ParseNumber(const std::string& value) {
  try {
    std::size_t consumed = 0;
    auto        parsed   = std::stoull(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

static std::string StatusName(DeliveryStatus status) {
  switch (status) {
    case DELIVERY_STATUS_STARTED:
      return "started";
    case DELIVERY_STATUS_IN_PROGRESS:
      return "in_progress";
    case DELIVERY_STATUS_COMPLETED:
      return "completed";
    case DELIVERY_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

static std::string OutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CYCLE_OUTCOME_DISABLED:
      return "disabled";
    case CYCLE_OUTCOME_SKIPPED:
      return "skipped";
    case CYCLE_OUTCOME_COMPLETED:
      return "completed";
    case CYCLE_OUTCOME_DISCONNECTED:
      return "disconnected";
    default:
      return "unspecified";
  }
}

static void PrintStatus(const MonitorStatus& status) {
  std::cout << "enabled=" << (status.enabled() ? "true" : "false") << "\n";
  std::cout << "known_groups=";
  for (int i = 0; i < status.known_groups_size(); ++i) {
    std::cout << (i ? "," : "") << status.known_groups(i);
  }
  std::cout << "\n";
  std::cout << "open_deliveries=" << status.open_deliveries() << "\n";
  if (status.has_last_cycle_at()) {
    std::cout << "last_cycle_at=" << status.last_cycle_at().seconds() << "\n";
  }
  std::cout << "cycles_completed=" << status.cycles_completed() << "\n";
  std::cout << "cycles_skipped=" << status.cycles_skipped() << "\n";
}

static void PrintActivity(const CycleActivity& activity) {
  switch (activity.type()) {
    case ACTIVITY_TYPE_DELIVERY_STARTED:
      std::cout << "  STARTED: " << activity.coffee_type() << " on group " << activity.group_number() << " (delivery "
                << activity.delivery_id() << ")\n";
      break;
    case ACTIVITY_TYPE_DELIVERY_COMPLETED:
      std::cout << "  COMPLETED: " << activity.coffee_type() << " on group " << activity.group_number() << " (delivery "
                << activity.delivery_id() << ")\n";
      break;
    case ACTIVITY_TYPE_DELIVERY_FAILED:
      std::cout << "  FAILED: " << activity.coffee_type() << " on group " << activity.group_number() << ": " << activity.message() << "\n";
      break;
    default:
      std::cout << "  ERROR: group " << activity.group_number() << ": " << activity.message() << "\n";
      break;
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto control_stub = MonitorControlService::NewStub(channel);
  auto report_stub  = DeliveryReportService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "start" || cmd == "stop" || cmd == "status") {
    grpc::ClientContext ctx;
    MonitorStatus       status;
    grpc::Status        rpc;

    if (cmd == "start") {
      StartMonitoringResponse resp;
      rpc    = control_stub->StartMonitoring(&ctx, StartMonitoringRequest{}, &resp);
      status = resp.status();
    } else if (cmd == "stop") {
      StopMonitoringResponse resp;
      rpc    = control_stub->StopMonitoring(&ctx, StopMonitoringRequest{}, &resp);
      status = resp.status();
    } else {
      GetStatusResponse resp;
      rpc    = control_stub->GetStatus(&ctx, GetStatusRequest{}, &resp);
      status = resp.status();
    }

    if (!rpc.ok()) return Fail(rpc);
    PrintStatus(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cycle") {
    grpc::ClientContext ctx;
    RunCycleResponse    resp;

    auto status = control_stub->RunCycle(&ctx, RunCycleRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "outcome=" << OutcomeName(resp.report().outcome()) << "\n";
    for (const auto& activity : resp.report().activities()) {
      PrintActivity(activity);
    }
    std::cout << "open_deliveries=" << resp.report().open_deliveries() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliveries") {
    ListManualDeliveriesRequest req;
    if (argc >= 4) {
      auto group = ParseNumber(argv[3]);
      if (!group) {
        std::cerr << "invalid group: " << argv[3] << "\n";
        return 1;
      }
      req.set_group_number(static_cast<uint32_t>(*group));
    }
    if (argc >= 5) {
      auto status = ParseStatus(argv[4]);
      if (!status) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }
      req.set_status(*status);
    }

    grpc::ClientContext          ctx;
    ListManualDeliveriesResponse resp;

    auto status = report_stub->ListManualDeliveries(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& d : resp.deliveries()) {
      std::cout << d.id() << " group=" << d.group_number() << " coffee=" << d.coffee_type() << " status=" << StatusName(d.status())
                << " started_at=" << d.started_at().seconds();
      if (d.has_completed_at()) std::cout << " completed_at=" << d.completed_at().seconds();
      if (d.retroactive()) std::cout << " retroactive";
      if (!d.error_message().empty()) std::cout << " error=\"" << d.error_message() << "\"";
      std::cout << "\n";
    }
    std::cout << "total=" << resp.total_count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    ListMaintenanceLogsRequest req;
    if (argc >= 4) {
      auto limit = ParseNumber(argv[3]);
      if (!limit) {
        std::cerr << "invalid limit: " << argv[3] << "\n";
        return 1;
      }
      req.set_limit(static_cast<uint32_t>(*limit));
    }

    grpc::ClientContext         ctx;
    ListMaintenanceLogsResponse resp;

    auto status = report_stub->ListMaintenanceLogs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& e : resp.entries()) {
      std::cout << e.created_at().seconds() << " [" << e.log_type() << "]";
      if (e.group_number() != 0) std::cout << " group=" << e.group_number();
      std::cout << " " << e.message() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    auto duration = ParseNumber(argv[3]);
    auto interval = argc >= 5 ? ParseNumber(argv[4]) : std::optional<uint64_t>(2);
    if (!duration || !interval || *interval == 0) {
      std::cerr << "invalid duration or interval\n";
      return 1;
    }

    std::cout << "Monitoring button presses for " << *duration << "s (interval " << *interval << "s)\n";

    const auto deadline  = std::chrono::steady_clock::now() + std::chrono::seconds(*duration);
    uint64_t   cycles    = 0;
    uint64_t   started   = 0;
    uint64_t   completed = 0;
    uint64_t   errors    = 0;

    while (std::chrono::steady_clock::now() < deadline) {
      grpc::ClientContext ctx;
      RunCycleResponse    resp;

      auto status = control_stub->RunCycle(&ctx, RunCycleRequest{}, &resp);
      if (!status.ok()) return Fail(status);
      ++cycles;

      const auto& report = resp.report();
      if (report.activities_size() > 0) {
        std::cout << "Cycle " << cycles << ": " << report.activities_size() << " activities\n";
      }
      for (const auto& activity : report.activities()) {
        PrintActivity(activity);
        if (activity.type() == ACTIVITY_TYPE_DELIVERY_STARTED) ++started;
        if (activity.type() == ACTIVITY_TYPE_DELIVERY_COMPLETED) ++completed;
        if (activity.type() == ACTIVITY_TYPE_ERROR || activity.type() == ACTIVITY_TYPE_DELIVERY_FAILED) ++errors;
      }

      std::this_thread::sleep_for(std::chrono::seconds(*interval));
    }

    std::cout << "\nMonitoring completed:\n"
              << "  cycles=" << cycles << "\n"
              << "  deliveries_started=" << started << "\n"
              << "  deliveries_completed=" << completed << "\n"
              << "  errors=" << errors << "\n";
    return 0;
  }

  Usage();
  return 1;
}
