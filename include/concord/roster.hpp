#pragma once

// concord/roster.hpp — Materialized participant roster.
//
// The roster is never persisted. It is rebuilt by folding the stream's queue
// entries in append order on every call:
//   ParticipantJoined  creates a snapshot; ignored when one already exists.
//   FocusChanged       sets / clears focus of a known participant.
//   DriveIntentSet     sets drive intent of a known participant.
//   any other kind     touches last_activity_at of a known participant.
// Events naming a participant without a prior join are dropped, which keeps
// stale or foreign events from inventing participants.
//
// Entries of every replay status are folded: a failed entry still records
// what this node did locally.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "concord/event.hpp"
#include "concord/queue_store.hpp"

namespace concord {

struct ParticipantSnapshot {
  std::string participant_id;
  std::string role;
  std::optional<FocusTarget> focus;
  DriveIntent drive_intent{DriveIntent::inactive};
  std::string joined_at;
  std::string last_activity_at;

  bool operator==(const ParticipantSnapshot&) const = default;
};

using Roster = std::map<std::string, ParticipantSnapshot>;

void fold_event(Roster& roster, const EventEnvelope& event);

Roster fold_entries(const std::vector<QueueEntry>& entries);

// Convenience over the queue store.
Roster build_roster(const EventQueueStore& store, const std::string& stream_id);

std::string snapshot_to_json(const ParticipantSnapshot& s);
std::string roster_to_json(const Roster& roster);

}  // namespace concord
