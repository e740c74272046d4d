#pragma once

#include <memory>

namespace brewmon::db { class Repository; }
namespace brewmon::monitor {
class MonitoringFlag;
class PollCycle;
class DeliveryTracker;
}

namespace brewmon::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<brewmon::db::Repository> repository;
  std::shared_ptr<brewmon::monitor::MonitoringFlag> flag;
  std::shared_ptr<brewmon::monitor::PollCycle> poll_cycle;
  std::shared_ptr<brewmon::monitor::DeliveryTracker> tracker;
};

}
