#pragma once

#include <atomic>
#include <cstdint>

namespace brewmon::monitor {

/*
  Process-wide monitoring switch.

  Lock-free; safe to toggle while a cycle is reading it. A change is seen
  by the next cycle that reads it. Every disabled → enabled transition
  opens a new epoch, which the poll cycle uses to drop stale baselines.
*/
class MonitoringFlag {
 public:
  struct State {
    bool          enabled = false;
    std::uint64_t epoch   = 0;
  };

  explicit MonitoringFlag(bool enabled = false);

  // Returns false if already enabled (epoch unchanged).
  bool Enable();
  // Returns false if already disabled.
  bool Disable();

  bool IsEnabled() const;

  // enabled and epoch read together
  State Load() const;

 private:
  // bit 0 = enabled, bits 1.. = epoch
  std::atomic<std::uint64_t> word_;
};

} // namespace brewmon::monitor
