#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace brewmon::monitor {

enum class TransitionKind {
  kNoChange,
  kPressStarted,
  kPressCompleted,
  kReadFailed,
};

const char* TransitionKindName(TransitionKind kind);

/*
  Classified change for one group in one cycle.

  coffee_type_hint: for PressStarted the hint of the new snapshot, for
  PressCompleted the hint of the last active snapshot.
  error: reader message for ReadFailed.
  baseline: NoChange because the group had no previous snapshot; active
  is the state of that first reading.
  interrupted: PressCompleted for an activity during which a read of the
  group failed.
*/
struct TransitionEvent {
  TransitionKind             kind     = TransitionKind::kNoChange;
  std::uint32_t              group_id = 0;
  std::optional<std::string> coffee_type_hint;
  std::string                error;
  bool                       baseline    = false;
  bool                       active      = false;
  bool                       interrupted = false;
  util::TimePoint            observed_at{};
};

} // namespace brewmon::monitor
