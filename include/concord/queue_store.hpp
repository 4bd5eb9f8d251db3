#pragma once

// concord/queue_store.hpp — Durable append-only event queue, one NDJSON file
// per stream (mission) at <home>/queues/<stream_id>.jsonl.
//
// Line format: the canonical envelope fields plus local replay metadata
//   _replay_status  "pending" | "delivered" | "failed"
//   _retry_count    integer
//   _last_retry_at  ISO-8601 or null
//   _digest         BLAKE3 ("evt:" domain) of the canonical envelope JSON
//
// DESIGN INVARIANTS:
//   - Entries are never deleted. Delivered entries stay as audit trail and as
//     input to the roster fold.
//   - Append order == logical_clock order for entries of one origin node.
//   - All mutations (append, status rewrite) hold an exclusive flock on
//     <stream_id>.lock. Reads do not lock: appends are single write() calls
//     and rewrites are atomic renames, so a reader sees either the old or the
//     new file, plus at most one truncated trailing line.
//   - A malformed line, a truncated trailing line, a digest mismatch or an
//     entry for another aggregate is skipped with a logged warning. One bad
//     line never blocks access to the rest of the log.
//   - Lines written before _digest existed (queue format v1) load without an
//     integrity check.
//
// EXTENSION_POINT: queue_compaction
//   Current: linear scan of the whole file on every read.
//   Upgrade path: periodic checkpoint of delivered entries into a snapshot
//   file consumed by the roster fold.
//   Invariant: compaction must never drop a pending or failed entry.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "concord/event.hpp"
#include "concord/types.hpp"

namespace concord {

// Stream (mission) ids become file and directory names: non-empty, no path
// separators, not "." or "..".
bool is_valid_stream_id(const std::string& id);

enum class ReplayStatus { pending, delivered, failed };
std::string to_string(ReplayStatus status);
std::optional<ReplayStatus> parse_replay_status(const std::string& text);

struct QueueEntry {
  EventEnvelope event;
  ReplayStatus  replay_status{ReplayStatus::pending};
  uint32_t      retry_count{0};
  std::optional<std::string> last_retry_at;
};

struct StatusUpdate {
  ReplayStatus status{ReplayStatus::pending};
  uint32_t     retry_count{0};
  std::optional<std::string> last_retry_at;
};

struct QueueSummary {
  uint64_t total{0};
  uint64_t pending{0};
  uint64_t delivered{0};
  uint64_t failed{0};
  std::vector<std::string> failed_event_ids;
};

std::string queue_summary_to_json(const QueueSummary& s);

// Serialise one stored line (without the trailing '\n').
std::string entry_to_line(const QueueEntry& entry);

// Parse one stored line. nullopt + *error on malformed input, digest mismatch
// or invalid envelope.
std::optional<QueueEntry> parse_entry_line(const std::string& line, std::string* error);

class EventQueueStore {
 public:
  explicit EventQueueStore(std::filesystem::path home);

  std::filesystem::path queue_path(const std::string& stream_id) const;

  // Durably append. OpError{io_failure} when nothing was appended;
  // OpError{invalid_input} when the envelope belongs to another stream.
  OpError append(const std::string& stream_id, const EventEnvelope& envelope,
                 ReplayStatus status = ReplayStatus::pending);

  // Builds the envelope while holding the stream lock, then appends it. The
  // stamper is where the Lamport clock advances, so two processes sharing a
  // node id append in clock order. The stamper must not touch this stream's
  // lock. Returns the appended envelope, or nullopt + *error with nothing
  // appended.
  using EnvelopeStamper = std::function<std::optional<EventEnvelope>(OpError*)>;
  std::optional<EventEnvelope> append_stamped(const std::string& stream_id,
                                              const EnvelopeStamper& stamper, OpError* error,
                                              ReplayStatus status = ReplayStatus::pending);

  std::vector<QueueEntry> read_all(const std::string& stream_id) const;
  std::vector<QueueEntry> read_pending(const std::string& stream_id) const;

  std::optional<QueueEntry> find(const std::string& stream_id,
                                 const std::string& event_id) const;

  // Rewrite the log with new metadata for the given event ids. Ids not in the
  // log are ignored. Corrupt lines are preserved verbatim.
  OpError update_status(const std::string& stream_id,
                        const std::map<std::string, StatusUpdate>& updates);

  QueueSummary summary(const std::string& stream_id) const;

  // failed → pending for every failed entry. Returns the number moved.
  std::optional<uint64_t> requeue_failed(const std::string& stream_id, OpError* error);

 private:
  std::filesystem::path lock_path(const std::string& stream_id) const;
  OpError check_owner(const std::string& stream_id, const EventEnvelope& envelope) const;
  // Caller holds the stream lock.
  OpError write_entry(const std::string& stream_id, const EventEnvelope& envelope,
                      ReplayStatus status);

  std::filesystem::path queues_dir_;
};

}  // namespace concord
