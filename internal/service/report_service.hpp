#pragma once

#include "brewmon/v1.hpp"
#include "service_context.hpp"

namespace brewmon::service {

inline constexpr uint32_t kDefaultPageSize = 50;
inline constexpr uint32_t kMaxPageSize     = 500;

/*
  Read-only reporting over manual deliveries and the maintenance log.
*/
class ReportService {
public:
  explicit ReportService(ServiceContext ctx);

  brewmon::v1::ListManualDeliveriesResponse
  ListManualDeliveries(const brewmon::v1::ListManualDeliveriesRequest& req);

  brewmon::v1::ListMaintenanceLogsResponse
  ListMaintenanceLogs(const brewmon::v1::ListMaintenanceLogsRequest& req);

private:
  ServiceContext ctx_;
};

}
