#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "brewmon/services/v1/delivery_report_service.grpc.pb.h"
#include "internal/service/report_service.hpp"

namespace brewmon::grpc {

class DeliveryReportServer final : public brewmon::services::v1::DeliveryReportService::Service {
public:
  explicit DeliveryReportServer(std::shared_ptr<brewmon::service::ReportService> svc);

  ::grpc::Status ListManualDeliveries(::grpc::ServerContext*,
                                      const brewmon::services::v1::ListManualDeliveriesRequest*,
                                      brewmon::services::v1::ListManualDeliveriesResponse*) override;

  ::grpc::Status ListMaintenanceLogs(::grpc::ServerContext*,
                                     const brewmon::services::v1::ListMaintenanceLogsRequest*,
                                     brewmon::services::v1::ListMaintenanceLogsResponse*) override;

private:
  std::shared_ptr<brewmon::service::ReportService> service_;
};

}
