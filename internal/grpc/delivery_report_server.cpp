#include "delivery_report_server.hpp"

#include "grpc_error.hpp"

namespace brewmon::grpc {

using namespace brewmon::services::v1;

DeliveryReportServer::DeliveryReportServer(std::shared_ptr<brewmon::service::ReportService> svc) : service_(std::move(svc)) {
}

::grpc::Status DeliveryReportServer::ListManualDeliveries(::grpc::ServerContext*, const ListManualDeliveriesRequest* req,
                                                          ListManualDeliveriesResponse* resp) {
  try {
    *resp = service_->ListManualDeliveries(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeliveryReportServer::ListMaintenanceLogs(::grpc::ServerContext*, const ListMaintenanceLogsRequest* req,
                                                         ListMaintenanceLogsResponse* resp) {
  try {
    *resp = service_->ListMaintenanceLogs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace brewmon::grpc
