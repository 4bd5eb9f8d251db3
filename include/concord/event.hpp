#pragma once

// concord/event.hpp — Event envelope model and JSON codec.
//
// An envelope is the immutable record of one domain event. The set of event
// kinds is closed; each kind has exactly one payload shape, held in a tagged
// variant and validated when the envelope is built or parsed. Nothing
// downstream ever sees a payload of the wrong shape for its event_type.
//
// DESIGN INVARIANTS:
//   - event_id is a valid 26-char id; causation_id, when present, too.
//   - aggregate_id == "mission/" + payload.mission_id.
//   - logical_clock is the Lamport value of origin_node at creation. It is the
//     only ordering authority; `timestamp` is advisory.
//   - Envelope JSON is canonical (sorted keys, compact). The queue integrity
//     digest is computed over envelope_to_json() and must stay stable for the
//     lifetime of an entry.
//
// EXTENSION_POINT: envelope_metadata
//   correlation_id, project_uuid and schema_version are owned by an external
//   schema component. They are not emitted; unknown top-level keys on parse
//   are ignored so envelopes carrying them still load.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "concord/jsonlite.hpp"
#include "concord/types.hpp"

namespace concord {

constexpr size_t kMaxCommentLength = 500;   // Unicode code points

enum class EventType {
  participant_joined,
  focus_changed,
  drive_intent_set,
  potential_step_collision_detected,
  concurrent_driver_warning,
  warning_acknowledged,
  comment_posted,
  decision_captured,
};

// Wire names: "ParticipantJoined", "FocusChanged", ...
std::string to_string(EventType type);
std::optional<EventType> parse_event_type(const std::string& name);

enum class DriveIntent { inactive, active };
std::string to_string(DriveIntent intent);
std::optional<DriveIntent> parse_drive_intent(const std::string& text);

enum class Severity { medium, high };
std::string to_string(Severity severity);
std::optional<Severity> parse_severity(const std::string& text);

enum class AckAction { continue_, hold, reassign, defer };
std::string to_string(AckAction action);
std::optional<AckAction> parse_ack_action(const std::string& text);

// ---------------------------------------------------------------------------
// FocusTarget: "wp:<id>" / "step:<id>" locally,
// {"target_type":"work_package"|"step","target_id":"<id>"} on the wire.
// ---------------------------------------------------------------------------
struct FocusTarget {
  enum class Kind { work_package, step };
  Kind        kind{Kind::work_package};
  std::string id;

  bool operator==(const FocusTarget&) const = default;
};

// nullopt for anything other than "wp:<id>" / "step:<id>" with a non-empty id.
std::optional<FocusTarget> parse_focus(const std::string& text);
std::string format_focus(const FocusTarget& focus);
std::string format_focus(const std::optional<FocusTarget>& focus);  // "none" when empty

jsonlite::Value focus_to_wire(const std::optional<FocusTarget>& focus);
// Accepts null or a well-formed target object. false on anything else.
bool focus_from_wire(const jsonlite::Value& value, std::optional<FocusTarget>* out);

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------
struct ParticipantJoinedPayload {
  std::string participant_id;
  std::string mission_id;
  std::string role;
  std::optional<std::string> display_name;
};

struct FocusChangedPayload {
  std::string participant_id;
  std::string mission_id;
  std::optional<FocusTarget> focus_target;
  std::optional<FocusTarget> previous_focus_target;
};

struct DriveIntentSetPayload {
  std::string participant_id;
  std::string mission_id;
  DriveIntent intent{DriveIntent::inactive};
};

// Shared by PotentialStepCollisionDetected (medium) and
// ConcurrentDriverWarning (high). participant_ids lists the requester first.
struct CollisionPayload {
  std::string participant_id;
  std::string mission_id;
  std::string warning_id;
  std::vector<std::string> participant_ids;
  std::optional<FocusTarget> focus_target;
  Severity severity{Severity::medium};
};

struct WarningAcknowledgedPayload {
  std::string participant_id;
  std::string mission_id;
  std::string warning_id;
  AckAction   acknowledgement{AckAction::defer};
};

struct CommentPostedPayload {
  std::string participant_id;
  std::string mission_id;
  std::string comment_id;
  std::string content;
  std::optional<std::string> reply_to;
  std::vector<std::string> mentions;
};

struct DecisionCapturedPayload {
  std::string participant_id;
  std::string mission_id;
  std::string decision_id;
  std::string topic;
  std::string chosen_option;
  std::optional<std::string> rationale;
  std::optional<std::string> referenced_warning_id;
};

using EventPayload = std::variant<ParticipantJoinedPayload,
                                  FocusChangedPayload,
                                  DriveIntentSetPayload,
                                  CollisionPayload,
                                  WarningAcknowledgedPayload,
                                  CommentPostedPayload,
                                  DecisionCapturedPayload>;

// Checks that the payload alternative matches the event type and that the
// payload's own fields are well-formed. Returns invalid_input on failure.
OpError validate_payload(EventType type, const EventPayload& payload);

// ---------------------------------------------------------------------------
// EventEnvelope
// ---------------------------------------------------------------------------
struct EventEnvelope {
  std::string  event_id;
  EventType    event_type{EventType::participant_joined};
  std::string  aggregate_id;
  EventPayload payload;
  std::string  timestamp;        // ISO-8601 UTC
  std::string  origin_node;
  uint64_t     logical_clock{0};
  std::optional<std::string> causation_id;

  const std::string& participant_id() const;
  const std::string& mission_id() const;
};

std::string aggregate_for_mission(const std::string& mission_id);

// Fields the caller supplies besides type and payload.
struct EnvelopeMeta {
  std::string event_id;
  std::string origin_node;
  uint64_t    logical_clock{0};
  std::string timestamp;          // empty → now
  std::optional<std::string> causation_id;
};

// Build and validate. On failure *error is set (invalid_input) and nullopt
// returned.
std::optional<EventEnvelope> make_envelope(EventType type, EventPayload payload,
                                           const EnvelopeMeta& meta, OpError* error);

OpError validate_envelope(const EventEnvelope& env);

jsonlite::Object envelope_to_object(const EventEnvelope& env);
std::string envelope_to_json(const EventEnvelope& env);

// Parse + validate. Unknown top-level keys are ignored.
std::optional<EventEnvelope> envelope_from_object(const jsonlite::Object& obj,
                                                  std::string* error);

// Truncate to at most `max_code_points` UTF-8 code points.
std::string truncate_utf8(const std::string& text, size_t max_code_points);
size_t utf8_length(const std::string& text);

}  // namespace concord
