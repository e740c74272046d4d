#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "transition_event.hpp"

namespace brewmon::monitor {

enum class TrackerAction {
  kNone,
  kCreated,      // new open manual record
  kCompleted,    // open manual record closed
  kRetroactive,  // completion without an observed start
  kFailed,       // open record failed on read error
  kDuplicate,    // start while a record was already open; absorbed
  kNotOwned,     // completion for a record another trigger path owns
  kReconciled,   // open manual record closed on an idle baseline reading
  kFailureEnded, // completion after a read failure; failed record gets completed_at
};

const char* TrackerActionName(TrackerAction action);

struct TrackerOutcome {
  TrackerAction                        action = TrackerAction::kNone;
  std::optional<db::model::DeliveryRecord> record;
};

/*
  Maps transition events onto delivery records.

  Owns "at most one open manual delivery per group": every event is a
  find-then-create or find-then-update inside one store transaction,
  together with the matching maintenance log entry.

  An idle baseline reading (first reading of a monitoring epoch) closes a
  manual record left open when monitoring stopped mid-delivery. A
  completion interrupted by a read failure ends the failed record instead
  of creating a retroactive one.

  Throws util::RecordStoreWriteFailed if the store rejects a write or the
  transaction cannot commit. DuplicateOpenRecord never escapes Apply().
*/
class DeliveryTracker {
 public:
  explicit DeliveryTracker(std::shared_ptr<db::Repository> repository);

  TrackerOutcome Apply(const TransitionEvent& event);

  // Open (Started/InProgress) manual deliveries across all groups.
  std::uint64_t CountOpenManual();

 private:
  TrackerOutcome OnPressStarted(db::Transaction& tx, const TransitionEvent& event);
  TrackerOutcome OnPressCompleted(db::Transaction& tx, const TransitionEvent& event);
  TrackerOutcome OnReadFailed(db::Transaction& tx, const TransitionEvent& event);
  TrackerOutcome OnIdleBaseline(db::Transaction& tx, const TransitionEvent& event);

  // Newest manual record of the group if it failed on a read error and has
  // no completion time yet.
  std::optional<db::model::DeliveryRecord> FindInterruptedDelivery(db::Transaction& tx, std::uint32_t group);

  void WriteLog(db::Transaction& tx, const char* log_type, std::uint32_t group, const std::string& message, std::uint64_t at_ms);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace brewmon::monitor
