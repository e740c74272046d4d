#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace brewmon::db { class Repository; }
namespace brewmon::hardware { class RegisterReader; }
namespace brewmon::monitor {
class MonitoringFlag;
class PollCycle;
class CycleTicker;
}
namespace brewmon::service {
class MonitorService;
class ReportService;
}

namespace brewmon::factory {

/*
  Application

  Owns all long-lived objects used by the daemon. Everything here lives
  for the lifetime of the process. The ticker is built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<hardware::RegisterReader> reader;
  std::shared_ptr<monitor::MonitoringFlag>  flag;
  std::shared_ptr<monitor::PollCycle>       poll_cycle;

  std::shared_ptr<service::MonitorService> monitor_service;
  std::shared_ptr<service::ReportService>  report_service;

  std::unique_ptr<monitor::CycleTicker>         ticker;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;
  ~Application();
};

// Range checks the loader cannot express. Throws util::InvalidArgument.
void ValidateConfig(const brewmon::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const brewmon::runtime::config::RuntimeConfig& config);

std::shared_ptr<hardware::RegisterReader> BuildRegisterReader(const brewmon::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and reader types.
*/
Application Build(const brewmon::runtime::config::RuntimeConfig& config);

} // namespace brewmon::factory
