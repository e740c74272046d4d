#include "monitor_control_server.hpp"

#include "grpc_error.hpp"

namespace brewmon::grpc {

using namespace brewmon::services::v1;

MonitorControlServer::MonitorControlServer(std::shared_ptr<brewmon::service::MonitorService> svc) : service_(std::move(svc)) {
}

::grpc::Status MonitorControlServer::StartMonitoring(::grpc::ServerContext*, const StartMonitoringRequest* req, StartMonitoringResponse* resp) {
  try {
    *resp = service_->StartMonitoring(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorControlServer::StopMonitoring(::grpc::ServerContext*, const StopMonitoringRequest* req, StopMonitoringResponse* resp) {
  try {
    *resp = service_->StopMonitoring(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorControlServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorControlServer::RunCycle(::grpc::ServerContext*, const RunCycleRequest* req, RunCycleResponse* resp) {
  try {
    *resp = service_->RunCycle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace brewmon::grpc
