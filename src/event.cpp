#include "concord/event.hpp"

#include <array>
#include <utility>

#include "concord/ulid.hpp"

namespace concord {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

struct TypeName {
  EventType   type;
  const char* wire;
};

constexpr std::array<TypeName, 8> kTypeNames{{
    {EventType::participant_joined, "ParticipantJoined"},
    {EventType::focus_changed, "FocusChanged"},
    {EventType::drive_intent_set, "DriveIntentSet"},
    {EventType::potential_step_collision_detected, "PotentialStepCollisionDetected"},
    {EventType::concurrent_driver_warning, "ConcurrentDriverWarning"},
    {EventType::warning_acknowledged, "WarningAcknowledged"},
    {EventType::comment_posted, "CommentPosted"},
    {EventType::decision_captured, "DecisionCaptured"},
}};

Value str(const std::string& s) { return Value{s}; }

Value str_array(const std::vector<std::string>& items) {
  Array a;
  a.reserve(items.size());
  for (const auto& s : items) a.push_back(str(s));
  return Value{std::move(a)};
}

void put_optional(Object& o, const char* key, const std::optional<std::string>& v) {
  if (v) o[key] = str(*v);
}

std::optional<std::string> opt_string(const Object& o, const char* key) {
  if (!jsonlite::has_key(o, key) || jsonlite::is_null(o, key)) return std::nullopt;
  return jsonlite::get_string(o, key);
}

OpError invalid(const std::string& message) {
  return OpError{ErrorCode::invalid_input, message};
}

OpError require(const std::string& value, const char* field) {
  if (value.empty()) return invalid(std::string(field) + " must not be empty");
  return {};
}

OpError require_id(const std::string& value, const char* field) {
  if (!is_valid_id(value)) return invalid(std::string(field) + " is not a valid 26-char id");
  return {};
}

OpError check_focus(const std::optional<FocusTarget>& f, const char* field) {
  if (f && f->id.empty()) return invalid(std::string(field) + " has an empty target id");
  return {};
}

// Per-payload field checks. The common participant/mission checks run first.
OpError check(const ParticipantJoinedPayload& p) { return require(p.role, "role"); }

OpError check(const FocusChangedPayload& p) {
  if (auto e = check_focus(p.focus_target, "focus_target")) return e;
  return check_focus(p.previous_focus_target, "previous_focus_target");
}

OpError check(const DriveIntentSetPayload&) { return {}; }

OpError check(const CollisionPayload& p) {
  if (auto e = require_id(p.warning_id, "warning_id")) return e;
  if (p.participant_ids.empty()) return invalid("participant_ids must not be empty");
  for (const auto& id : p.participant_ids) {
    if (id.empty()) return invalid("participant_ids contains an empty id");
  }
  return check_focus(p.focus_target, "focus_target");
}

OpError check(const WarningAcknowledgedPayload& p) {
  return require_id(p.warning_id, "warning_id");
}

OpError check(const CommentPostedPayload& p) {
  if (auto e = require_id(p.comment_id, "comment_id")) return e;
  if (auto e = require(p.content, "content")) return e;
  if (utf8_length(p.content) > kMaxCommentLength) {
    return invalid("content exceeds " + std::to_string(kMaxCommentLength) + " characters");
  }
  if (p.reply_to) {
    if (auto e = require_id(*p.reply_to, "reply_to")) return e;
  }
  return {};
}

OpError check(const DecisionCapturedPayload& p) {
  if (auto e = require_id(p.decision_id, "decision_id")) return e;
  if (auto e = require(p.topic, "topic")) return e;
  if (auto e = require(p.chosen_option, "chosen_option")) return e;
  if (p.referenced_warning_id) {
    if (auto e = require_id(*p.referenced_warning_id, "referenced_warning_id")) return e;
  }
  return {};
}

bool type_matches(EventType type, const EventPayload& payload) {
  switch (type) {
    case EventType::participant_joined:
      return std::holds_alternative<ParticipantJoinedPayload>(payload);
    case EventType::focus_changed:
      return std::holds_alternative<FocusChangedPayload>(payload);
    case EventType::drive_intent_set:
      return std::holds_alternative<DriveIntentSetPayload>(payload);
    case EventType::potential_step_collision_detected:
    case EventType::concurrent_driver_warning:
      return std::holds_alternative<CollisionPayload>(payload);
    case EventType::warning_acknowledged:
      return std::holds_alternative<WarningAcknowledgedPayload>(payload);
    case EventType::comment_posted:
      return std::holds_alternative<CommentPostedPayload>(payload);
    case EventType::decision_captured:
      return std::holds_alternative<DecisionCapturedPayload>(payload);
  }
  return false;
}

Object payload_to_object(const EventPayload& payload) {
  Object o;
  std::visit([&](const auto& p) {
    o["participant_id"] = str(p.participant_id);
    o["mission_id"] = str(p.mission_id);
  }, payload);

  if (const auto* p = std::get_if<ParticipantJoinedPayload>(&payload)) {
    o["role"] = str(p->role);
    put_optional(o, "display_name", p->display_name);
  } else if (const auto* p = std::get_if<FocusChangedPayload>(&payload)) {
    o["focus_target"] = focus_to_wire(p->focus_target);
    o["previous_focus_target"] = focus_to_wire(p->previous_focus_target);
  } else if (const auto* p = std::get_if<DriveIntentSetPayload>(&payload)) {
    o["intent"] = str(to_string(p->intent));
  } else if (const auto* p = std::get_if<CollisionPayload>(&payload)) {
    o["warning_id"] = str(p->warning_id);
    o["participant_ids"] = str_array(p->participant_ids);
    o["focus_target"] = focus_to_wire(p->focus_target);
    o["severity"] = str(to_string(p->severity));
  } else if (const auto* p = std::get_if<WarningAcknowledgedPayload>(&payload)) {
    o["warning_id"] = str(p->warning_id);
    o["acknowledgement"] = str(to_string(p->acknowledgement));
  } else if (const auto* p = std::get_if<CommentPostedPayload>(&payload)) {
    o["comment_id"] = str(p->comment_id);
    o["content"] = str(p->content);
    put_optional(o, "reply_to", p->reply_to);
    o["mentions"] = str_array(p->mentions);
  } else if (const auto* p = std::get_if<DecisionCapturedPayload>(&payload)) {
    o["decision_id"] = str(p->decision_id);
    o["topic"] = str(p->topic);
    o["chosen_option"] = str(p->chosen_option);
    put_optional(o, "rationale", p->rationale);
    put_optional(o, "referenced_warning_id", p->referenced_warning_id);
  }
  return o;
}

std::optional<EventPayload> payload_from_object(EventType type, const Object& o,
                                                std::string* error) {
  using jsonlite::get_string;
  const std::string participant_id = get_string(o, "participant_id");
  const std::string mission_id = get_string(o, "mission_id");

  const auto read_focus = [&](const char* key, std::optional<FocusTarget>* out) {
    auto it = o.find(key);
    if (it == o.end()) return true;
    if (focus_from_wire(it->second, out)) return true;
    if (error) *error = std::string("malformed ") + key;
    return false;
  };

  switch (type) {
    case EventType::participant_joined: {
      ParticipantJoinedPayload p{participant_id, mission_id, get_string(o, "role"),
                                 opt_string(o, "display_name")};
      return EventPayload{std::move(p)};
    }
    case EventType::focus_changed: {
      FocusChangedPayload p{participant_id, mission_id, std::nullopt, std::nullopt};
      if (!read_focus("focus_target", &p.focus_target)) return std::nullopt;
      if (!read_focus("previous_focus_target", &p.previous_focus_target)) return std::nullopt;
      return EventPayload{std::move(p)};
    }
    case EventType::drive_intent_set: {
      const auto intent = parse_drive_intent(get_string(o, "intent"));
      if (!intent) {
        if (error) *error = "invalid intent";
        return std::nullopt;
      }
      return EventPayload{DriveIntentSetPayload{participant_id, mission_id, *intent}};
    }
    case EventType::potential_step_collision_detected:
    case EventType::concurrent_driver_warning: {
      const auto severity = parse_severity(get_string(o, "severity"));
      if (!severity) {
        if (error) *error = "invalid severity";
        return std::nullopt;
      }
      CollisionPayload p{participant_id, mission_id, get_string(o, "warning_id"),
                         jsonlite::get_string_array(o, "participant_ids"),
                         std::nullopt, *severity};
      if (!read_focus("focus_target", &p.focus_target)) return std::nullopt;
      return EventPayload{std::move(p)};
    }
    case EventType::warning_acknowledged: {
      const auto action = parse_ack_action(get_string(o, "acknowledgement"));
      if (!action) {
        if (error) *error = "invalid acknowledgement";
        return std::nullopt;
      }
      return EventPayload{WarningAcknowledgedPayload{participant_id, mission_id,
                                                     get_string(o, "warning_id"), *action}};
    }
    case EventType::comment_posted: {
      CommentPostedPayload p{participant_id, mission_id, get_string(o, "comment_id"),
                             get_string(o, "content"), opt_string(o, "reply_to"),
                             jsonlite::get_string_array(o, "mentions")};
      return EventPayload{std::move(p)};
    }
    case EventType::decision_captured: {
      DecisionCapturedPayload p{participant_id, mission_id, get_string(o, "decision_id"),
                                get_string(o, "topic"), get_string(o, "chosen_option"),
                                opt_string(o, "rationale"),
                                opt_string(o, "referenced_warning_id")};
      return EventPayload{std::move(p)};
    }
  }
  if (error) *error = "unknown event type";
  return std::nullopt;
}

}  // namespace

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

std::string to_string(EventType type) {
  for (const auto& t : kTypeNames) {
    if (t.type == type) return t.wire;
  }
  return "Unknown";
}

std::optional<EventType> parse_event_type(const std::string& name) {
  for (const auto& t : kTypeNames) {
    if (name == t.wire) return t.type;
  }
  return std::nullopt;
}

std::string to_string(DriveIntent intent) {
  return intent == DriveIntent::active ? "active" : "inactive";
}

std::optional<DriveIntent> parse_drive_intent(const std::string& text) {
  if (text == "active") return DriveIntent::active;
  if (text == "inactive") return DriveIntent::inactive;
  return std::nullopt;
}

std::string to_string(Severity severity) {
  return severity == Severity::high ? "high" : "medium";
}

std::optional<Severity> parse_severity(const std::string& text) {
  if (text == "high") return Severity::high;
  if (text == "medium") return Severity::medium;
  return std::nullopt;
}

std::string to_string(AckAction action) {
  switch (action) {
    case AckAction::continue_: return "continue";
    case AckAction::hold:      return "hold";
    case AckAction::reassign:  return "reassign";
    case AckAction::defer:     return "defer";
  }
  return "defer";
}

std::optional<AckAction> parse_ack_action(const std::string& text) {
  if (text == "continue") return AckAction::continue_;
  if (text == "hold") return AckAction::hold;
  if (text == "reassign") return AckAction::reassign;
  if (text == "defer") return AckAction::defer;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Focus
// ---------------------------------------------------------------------------

std::optional<FocusTarget> parse_focus(const std::string& text) {
  if (text.rfind("wp:", 0) == 0 && text.size() > 3) {
    return FocusTarget{FocusTarget::Kind::work_package, text.substr(3)};
  }
  if (text.rfind("step:", 0) == 0 && text.size() > 5) {
    return FocusTarget{FocusTarget::Kind::step, text.substr(5)};
  }
  return std::nullopt;
}

std::string format_focus(const FocusTarget& focus) {
  return (focus.kind == FocusTarget::Kind::work_package ? "wp:" : "step:") + focus.id;
}

std::string format_focus(const std::optional<FocusTarget>& focus) {
  return focus ? format_focus(*focus) : "none";
}

Value focus_to_wire(const std::optional<FocusTarget>& focus) {
  if (!focus) return Value{nullptr};
  Object o;
  o["target_type"] = str(focus->kind == FocusTarget::Kind::work_package ? "work_package" : "step");
  o["target_id"] = str(focus->id);
  return Value{std::move(o)};
}

bool focus_from_wire(const Value& value, std::optional<FocusTarget>* out) {
  if (std::holds_alternative<std::nullptr_t>(value.v)) {
    *out = std::nullopt;
    return true;
  }
  const auto* o = std::get_if<Object>(&value.v);
  if (!o) return false;
  const std::string type = jsonlite::get_string(*o, "target_type");
  const std::string id = jsonlite::get_string(*o, "target_id");
  if (id.empty()) return false;
  if (type == "work_package") {
    *out = FocusTarget{FocusTarget::Kind::work_package, id};
  } else if (type == "step") {
    *out = FocusTarget{FocusTarget::Kind::step, id};
  } else {
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

OpError validate_payload(EventType type, const EventPayload& payload) {
  if (!type_matches(type, payload)) {
    return invalid("payload shape does not match event type " + to_string(type));
  }
  OpError err = std::visit([](const auto& p) -> OpError {
    if (auto e = require(p.participant_id, "participant_id")) return e;
    if (auto e = require(p.mission_id, "mission_id")) return e;
    return check(p);
  }, payload);
  if (err) return err;

  if (const auto* c = std::get_if<CollisionPayload>(&payload)) {
    const Severity expected = type == EventType::concurrent_driver_warning
                                  ? Severity::high : Severity::medium;
    if (c->severity != expected) return invalid("severity does not match warning kind");
  }
  return {};
}

const std::string& EventEnvelope::participant_id() const {
  return std::visit([](const auto& p) -> const std::string& { return p.participant_id; },
                    payload);
}

const std::string& EventEnvelope::mission_id() const {
  return std::visit([](const auto& p) -> const std::string& { return p.mission_id; },
                    payload);
}

std::string aggregate_for_mission(const std::string& mission_id) {
  return "mission/" + mission_id;
}

OpError validate_envelope(const EventEnvelope& env) {
  if (auto e = require_id(env.event_id, "event_id")) return e;
  if (env.causation_id) {
    if (auto e = require_id(*env.causation_id, "causation_id")) return e;
  }
  if (auto e = require(env.origin_node, "origin_node")) return e;
  if (!parse_iso8601(env.timestamp)) return invalid("timestamp is not ISO-8601");
  if (auto e = validate_payload(env.event_type, env.payload)) return e;
  if (env.aggregate_id != aggregate_for_mission(env.mission_id())) {
    return invalid("aggregate_id does not match payload mission_id");
  }
  return {};
}

std::optional<EventEnvelope> make_envelope(EventType type, EventPayload payload,
                                           const EnvelopeMeta& meta, OpError* error) {
  EventEnvelope env;
  env.event_id = meta.event_id;
  env.event_type = type;
  env.payload = std::move(payload);
  env.origin_node = meta.origin_node;
  env.logical_clock = meta.logical_clock;
  env.causation_id = meta.causation_id;
  env.timestamp = meta.timestamp.empty() ? format_iso8601(now_unix_ms()) : meta.timestamp;
  std::visit([&](const auto& p) { env.aggregate_id = aggregate_for_mission(p.mission_id); },
             env.payload);

  if (OpError e = validate_envelope(env)) {
    if (error) *error = e;
    return std::nullopt;
  }
  return env;
}

// ---------------------------------------------------------------------------
// Codec
// ---------------------------------------------------------------------------

Object envelope_to_object(const EventEnvelope& env) {
  Object o;
  o["event_id"] = str(env.event_id);
  o["event_type"] = str(to_string(env.event_type));
  o["aggregate_id"] = str(env.aggregate_id);
  o["payload"] = Value{payload_to_object(env.payload)};
  o["timestamp"] = str(env.timestamp);
  o["origin_node"] = str(env.origin_node);
  o["logical_clock"] = Value{std::uint64_t{env.logical_clock}};
  if (env.causation_id) o["causation_id"] = str(*env.causation_id);
  return o;
}

std::string envelope_to_json(const EventEnvelope& env) {
  return jsonlite::to_json(envelope_to_object(env));
}

std::optional<EventEnvelope> envelope_from_object(const Object& obj, std::string* error) {
  const auto type = parse_event_type(jsonlite::get_string(obj, "event_type"));
  if (!type) {
    if (error) *error = "unknown event_type";
    return std::nullopt;
  }
  const auto payload_obj = jsonlite::get_object(obj, "payload");
  if (!payload_obj) {
    if (error) *error = "missing payload";
    return std::nullopt;
  }
  auto it = obj.find("logical_clock");
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) {
    if (error) *error = "logical_clock must be a non-negative integer";
    return std::nullopt;
  }

  auto payload = payload_from_object(*type, *payload_obj, error);
  if (!payload) return std::nullopt;

  EventEnvelope env;
  env.event_id = jsonlite::get_string(obj, "event_id");
  env.event_type = *type;
  env.aggregate_id = jsonlite::get_string(obj, "aggregate_id");
  env.payload = std::move(*payload);
  env.timestamp = jsonlite::get_string(obj, "timestamp");
  env.origin_node = jsonlite::get_string(obj, "origin_node");
  env.logical_clock = std::get<std::uint64_t>(it->second.v);
  env.causation_id = opt_string(obj, "causation_id");

  if (OpError e = validate_envelope(env)) {
    if (error) *error = e.message;
    return std::nullopt;
  }
  return env;
}

// ---------------------------------------------------------------------------
// UTF-8 helpers
// ---------------------------------------------------------------------------

size_t utf8_length(const std::string& text) {
  size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

std::string truncate_utf8(const std::string& text, size_t max_code_points) {
  size_t seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) == 0x80) continue;
    if (seen == max_code_points) return text.substr(0, i);
    ++seen;
  }
  return text;
}

}  // namespace concord
