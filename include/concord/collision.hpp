#pragma once

// concord/collision.hpp — Advisory collision detection before a participant
// starts driving.
//
// detect() builds the roster and counts the OTHER participants that share
// the requester's focus and are actively driving:
//   0     → no warning
//   1     → medium, PotentialStepCollisionDetected
//   2+    → high,   ConcurrentDriverWarning
// A requester without focus never collides. Participants the roster does not
// know (no join folded) are invisible, the requester included: an unknown
// requester gets no warning.
//
// A warning is emitted as an event before detect() returns. The warning's id
// is that event's id, so the later WarningAcknowledged can point at it via
// causation_id. Detection never blocks anyone: it only informs.

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "concord/event.hpp"
#include "concord/queue_store.hpp"
#include "concord/roster.hpp"

namespace concord {

struct CollisionWarning {
  std::string warning_id;
  EventType   kind{EventType::potential_step_collision_detected};
  Severity    severity{Severity::medium};
  std::optional<FocusTarget> focus;
  std::vector<ParticipantSnapshot> conflicting_participants;
};

std::string collision_warning_to_json(const CollisionWarning& w);

// Active drivers other than `requester` whose focus equals `focus`.
std::vector<ParticipantSnapshot> find_conflicts(const Roster& roster,
                                                const std::string& requester,
                                                const std::optional<FocusTarget>& focus);

// Persists (and attempts delivery of) a warning event with the given id.
using WarningEmitter =
    std::function<OpError(EventType type, EventPayload payload, const std::string& event_id)>;

struct DetectResult {
  std::optional<CollisionWarning> warning;
  OpError error;   // emission failed; no warning was recorded
};

class CollisionDetector {
 public:
  CollisionDetector(const EventQueueStore& store, WarningEmitter emit);

  DetectResult detect(const std::string& stream_id, const std::string& requester,
                      const std::optional<FocusTarget>& focus);

 private:
  const EventQueueStore& store_;
  WarningEmitter emit_;
};

}  // namespace concord
