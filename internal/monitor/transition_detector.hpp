#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>

#include "internal/hardware/register_reader.hpp"
#include "transition_event.hpp"

namespace brewmon::monitor {

/*
  Holds the last observed snapshot per group and classifies each new
  reading against it.

  Not thread-safe. The poll cycle's overlap guard ensures one caller at a
  time.
*/
class TransitionDetector {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit TransitionDetector(std::shared_ptr<hardware::RegisterReader> reader, ClockFn clock = {});

  /*
    Reads the group and classifies the change.

    - Read failure → ReadFailed; last snapshot is kept. A failure while
      the group was active marks the next PressCompleted interrupted.
    - No prior snapshot → NoChange with baseline set; the reading becomes
      the baseline.
    - idle → active → PressStarted, active → idle → PressCompleted.
  */
  TransitionEvent Observe(std::uint32_t group_id);

  // Classification step of Observe for an already read snapshot.
  TransitionEvent Classify(const hardware::RegisterSnapshot& current);

  // Forget all baselines (new monitoring epoch).
  void Reset();

  std::optional<hardware::RegisterSnapshot> LastSnapshot(std::uint32_t group_id) const;

 private:
  std::shared_ptr<hardware::RegisterReader>         reader_;
  ClockFn                                           clock_;
  std::map<std::uint32_t, hardware::RegisterSnapshot> last_;
  std::set<std::uint32_t>                           interrupted_;
};

} // namespace brewmon::monitor
