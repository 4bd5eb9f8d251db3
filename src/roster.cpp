#include "concord/roster.hpp"

#include <sstream>

#include "concord/jsonlite.hpp"

namespace concord {

void fold_event(Roster& roster, const EventEnvelope& event) {
  const std::string& pid = event.participant_id();

  if (const auto* joined = std::get_if<ParticipantJoinedPayload>(&event.payload)) {
    if (roster.count(pid)) return;
    ParticipantSnapshot s;
    s.participant_id = pid;
    s.role = joined->role;
    s.joined_at = event.timestamp;
    s.last_activity_at = event.timestamp;
    roster.emplace(pid, std::move(s));
    return;
  }

  auto it = roster.find(pid);
  if (it == roster.end()) return;
  ParticipantSnapshot& s = it->second;

  if (const auto* focus = std::get_if<FocusChangedPayload>(&event.payload)) {
    s.focus = focus->focus_target;
  } else if (const auto* drive = std::get_if<DriveIntentSetPayload>(&event.payload)) {
    s.drive_intent = drive->intent;
  }
  s.last_activity_at = event.timestamp;
}

Roster fold_entries(const std::vector<QueueEntry>& entries) {
  Roster roster;
  for (const auto& e : entries) fold_event(roster, e.event);
  return roster;
}

Roster build_roster(const EventQueueStore& store, const std::string& stream_id) {
  return fold_entries(store.read_all(stream_id));
}

std::string snapshot_to_json(const ParticipantSnapshot& s) {
  using jsonlite::escape;
  std::ostringstream o;
  o << "{"
    << "\"participant_id\":\"" << escape(s.participant_id) << "\""
    << ",\"role\":\"" << escape(s.role) << "\""
    << ",\"focus\":";
  if (s.focus) {
    o << "\"" << escape(format_focus(*s.focus)) << "\"";
  } else {
    o << "null";
  }
  o << ",\"drive_intent\":\"" << to_string(s.drive_intent) << "\""
    << ",\"joined_at\":\"" << escape(s.joined_at) << "\""
    << ",\"last_activity_at\":\"" << escape(s.last_activity_at) << "\""
    << "}";
  return o.str();
}

std::string roster_to_json(const Roster& roster) {
  std::string out = "[";
  bool first = true;
  for (const auto& [id, snapshot] : roster) {
    if (!first) out += ",";
    first = false;
    out += snapshot_to_json(snapshot);
  }
  out += "]";
  return out;
}

}  // namespace concord
