#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "brewmon/services/v1/monitor_control_service.grpc.pb.h"
#include "internal/service/monitor_service.hpp"

namespace brewmon::grpc {

class MonitorControlServer final : public brewmon::services::v1::MonitorControlService::Service {
public:
  explicit MonitorControlServer(std::shared_ptr<brewmon::service::MonitorService> svc);

  ::grpc::Status StartMonitoring(::grpc::ServerContext*,
                                 const brewmon::services::v1::StartMonitoringRequest*,
                                 brewmon::services::v1::StartMonitoringResponse*) override;

  ::grpc::Status StopMonitoring(::grpc::ServerContext*,
                                const brewmon::services::v1::StopMonitoringRequest*,
                                brewmon::services::v1::StopMonitoringResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                           const brewmon::services::v1::GetStatusRequest*,
                           brewmon::services::v1::GetStatusResponse*) override;

  ::grpc::Status RunCycle(::grpc::ServerContext*,
                          const brewmon::services::v1::RunCycleRequest*,
                          brewmon::services::v1::RunCycleResponse*) override;

private:
  std::shared_ptr<brewmon::service::MonitorService> service_;
};

}
