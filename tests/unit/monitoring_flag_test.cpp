#include "internal/monitor/monitoring_flag.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using brewmon::monitor::MonitoringFlag;

void TestStartsDisabledByDefault() {
  MonitoringFlag flag;
  assert(!flag.IsEnabled());
  assert(flag.Load().epoch == 0);
}

void TestEnableOpensNewEpochOnlyOnTransition() {
  MonitoringFlag flag;

  assert(flag.Enable());
  const auto first = flag.Load();
  assert(first.enabled);
  assert(first.epoch == 1);

  // already enabled: no new epoch
  assert(!flag.Enable());
  assert(flag.Load().epoch == 1);

  assert(flag.Disable());
  assert(!flag.Disable());
  const auto stopped = flag.Load();
  assert(!stopped.enabled);
  assert(stopped.epoch == 1);

  assert(flag.Enable());
  assert(flag.Load().epoch == 2);
}

void TestConstructedEnabledHasFirstEpoch() {
  MonitoringFlag flag(true);
  assert(flag.IsEnabled());
  assert(flag.Load().epoch == 1);
}

void TestConcurrentTogglesLeaveConsistentState() {
  MonitoringFlag        flag;
  std::atomic<uint64_t> enables{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 1000; ++i) {
        if (flag.Enable()) ++enables;
        (void)flag.IsEnabled();
        flag.Disable();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto state = flag.Load();
  assert(!state.enabled);
  // every successful enable opened exactly one epoch
  assert(state.epoch == enables.load());
}

} // namespace

int main() {
  TestStartsDisabledByDefault();
  TestEnableOpensNewEpochOnlyOnTransition();
  TestConstructedEnabledHasFirstEpoch();
  TestConcurrentTogglesLeaveConsistentState();

  std::cout << "brewmon_unit_monitoring_flag: pass\n";
  return 0;
}
