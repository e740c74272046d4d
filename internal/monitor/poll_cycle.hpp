#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "cycle_report.hpp"
#include "delivery_tracker.hpp"
#include "monitoring_flag.hpp"
#include "transition_detector.hpp"

namespace brewmon::monitor {

inline constexpr std::uint32_t kDefaultGroupCount = 3;
inline constexpr std::uint32_t kMaxGroupCount     = 4;

/*
  One poll-detect-reconcile pass.

    guard → gate(flag) → for each known group: detect, track → report

  Run() never overlaps itself: a call that starts while another is still
  running returns a kSkipped report without touching the detector. It
  does not self-schedule; see CycleTicker.

  Failures are isolated per group and reported as activities; nothing
  raised inside a group scan escapes Run().
*/
class PollCycle {
 public:
  // configured_group_count: 0 means ask the reader.
  PollCycle(std::shared_ptr<MonitoringFlag> flag, std::shared_ptr<hardware::RegisterReader> reader,
            std::shared_ptr<TransitionDetector> detector, std::shared_ptr<DeliveryTracker> tracker, std::uint32_t configured_group_count = 0);

  CycleReport Run();

  // Groups scanned by the next cycle: configured count, else the reader's,
  // else kDefaultGroupCount; capped at kMaxGroupCount.
  std::vector<std::uint32_t> KnownGroups();

  bool InProgress() const {
    return in_progress_.load();
  }

 private:
  void ScanGroup(std::uint32_t group, CycleReport& report, bool& read_ok);

  std::shared_ptr<MonitoringFlag>           flag_;
  std::shared_ptr<hardware::RegisterReader> reader_;
  std::shared_ptr<TransitionDetector>       detector_;
  std::shared_ptr<DeliveryTracker>          tracker_;
  std::uint32_t                             configured_group_count_;

  std::atomic<bool> in_progress_{false};
  // guarded by in_progress_
  std::uint64_t last_epoch_ = 0;
};

} // namespace brewmon::monitor
