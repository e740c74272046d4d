#include "transition_detector.hpp"

#include "internal/util/errors.hpp"

namespace brewmon::monitor {

const char* TransitionKindName(TransitionKind kind) {
  switch (kind) {
    case TransitionKind::kNoChange:
      return "no_change";
    case TransitionKind::kPressStarted:
      return "press_started";
    case TransitionKind::kPressCompleted:
      return "press_completed";
    case TransitionKind::kReadFailed:
      return "read_failed";
  }
  return "unknown";
}

TransitionDetector::TransitionDetector(std::shared_ptr<hardware::RegisterReader> reader, ClockFn clock)
    : reader_(std::move(reader)), clock_(clock ? std::move(clock) : ClockFn(&util::Now)) {
}

TransitionEvent TransitionDetector::Observe(std::uint32_t group_id) {
  hardware::RegisterSnapshot current;
  try {
    current = reader_->Read(group_id);
  } catch (const util::HardwareUnavailable& e) {
    auto it = last_.find(group_id);
    if (it != last_.end() && it->second.IsActive()) interrupted_.insert(group_id);

    TransitionEvent event;
    event.kind        = TransitionKind::kReadFailed;
    event.group_id    = group_id;
    event.error       = e.what();
    event.observed_at = clock_();
    return event;
  }

  return Classify(current);
}

TransitionEvent TransitionDetector::Classify(const hardware::RegisterSnapshot& current) {
  TransitionEvent event;
  event.group_id    = current.group_id;
  event.observed_at = current.timestamp;
  event.active      = current.IsActive();

  auto it = last_.find(current.group_id);
  if (it == last_.end()) {
    event.baseline = true;
    last_.emplace(current.group_id, current);
    return event;
  }

  const auto& previous = it->second;
  if (!previous.IsActive() && current.IsActive()) {
    event.kind             = TransitionKind::kPressStarted;
    event.coffee_type_hint = current.coffee_type_hint;
    interrupted_.erase(current.group_id);
  } else if (previous.IsActive() && !current.IsActive()) {
    event.kind             = TransitionKind::kPressCompleted;
    event.coffee_type_hint = previous.coffee_type_hint;
    event.interrupted      = interrupted_.erase(current.group_id) > 0;
  }

  it->second = current;
  return event;
}

void TransitionDetector::Reset() {
  last_.clear();
  interrupted_.clear();
}

std::optional<hardware::RegisterSnapshot> TransitionDetector::LastSnapshot(std::uint32_t group_id) const {
  auto it = last_.find(group_id);
  if (it == last_.end()) return std::nullopt;
  return it->second;
}

} // namespace brewmon::monitor
