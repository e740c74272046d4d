#pragma once

#include <cstdint>
#include <string>

namespace brewmon::db::model {

// log_type values written by the monitor
inline constexpr const char* kLogManualDelivery   = "manual_delivery";
inline constexpr const char* kLogPurge            = "purge";
inline constexpr const char* kLogHealthCheck      = "health_check";
inline constexpr const char* kLogConnectionIssue  = "connection_issue";

struct MaintenanceLogRecord {
  std::uint64_t id = 0;
  std::string   log_type;
  std::uint32_t group_number = 0; // 0 = not group specific
  std::string   message;
  bool          resolved      = false;
  std::uint64_t created_at_ms = 0;
};

} // namespace brewmon::db::model
