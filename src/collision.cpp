#include "concord/collision.hpp"

#include <sstream>

#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"
#include "concord/ulid.hpp"

namespace concord {

std::string collision_warning_to_json(const CollisionWarning& w) {
  std::ostringstream o;
  o << "{"
    << "\"warning_id\":\"" << w.warning_id << "\""
    << ",\"type\":\"" << to_string(w.kind) << "\""
    << ",\"severity\":\"" << to_string(w.severity) << "\""
    << ",\"focus\":\"" << jsonlite::escape(format_focus(w.focus)) << "\""
    << ",\"conflicting_participants\":[";
  for (size_t i = 0; i < w.conflicting_participants.size(); ++i) {
    if (i) o << ",";
    o << snapshot_to_json(w.conflicting_participants[i]);
  }
  o << "]}";
  return o.str();
}

std::vector<ParticipantSnapshot> find_conflicts(const Roster& roster,
                                                const std::string& requester,
                                                const std::optional<FocusTarget>& focus) {
  std::vector<ParticipantSnapshot> out;
  if (!focus) return out;
  for (const auto& [id, s] : roster) {
    if (id == requester) continue;
    if (s.drive_intent != DriveIntent::active) continue;
    if (s.focus != focus) continue;
    out.push_back(s);
  }
  return out;
}

CollisionDetector::CollisionDetector(const EventQueueStore& store, WarningEmitter emit)
    : store_(store), emit_(std::move(emit)) {}

DetectResult CollisionDetector::detect(const std::string& stream_id,
                                       const std::string& requester,
                                       const std::optional<FocusTarget>& focus) {
  DetectResult result;
  if (!focus) return result;

  const Roster roster = build_roster(store_, stream_id);
  if (!roster.count(requester)) return result;
  auto conflicts = find_conflicts(roster, requester, focus);
  if (conflicts.empty()) return result;

  CollisionWarning w;
  w.warning_id = generate_id();
  w.severity = conflicts.size() >= 2 ? Severity::high : Severity::medium;
  w.kind = w.severity == Severity::high ? EventType::concurrent_driver_warning
                                        : EventType::potential_step_collision_detected;
  w.focus = focus;
  w.conflicting_participants = std::move(conflicts);

  CollisionPayload payload;
  payload.participant_id = requester;
  payload.mission_id = stream_id;
  payload.warning_id = w.warning_id;
  payload.participant_ids.push_back(requester);
  for (const auto& p : w.conflicting_participants) payload.participant_ids.push_back(p.participant_id);
  payload.focus_target = focus;
  payload.severity = w.severity;

  if (OpError err = emit_(w.kind, EventPayload{std::move(payload)}, w.warning_id)) {
    result.error = err;
    return result;
  }

  global_sync_stats().collisions_detected.fetch_add(1, std::memory_order_relaxed);
  log_info("collision", "collision warning emitted",
           {{"stream_id", stream_id}, {"warning_id", w.warning_id},
            {"severity", to_string(w.severity)},
            {"conflicts", std::to_string(w.conflicting_participants.size())}});
  result.warning = std::move(w);
  return result;
}

}  // namespace concord
