#include "concord/session.hpp"

#include <filesystem>
#include <sstream>

#include "concord/file_io.hpp"
#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"
#include "concord/queue_store.hpp"
#include "concord/ulid.hpp"

namespace concord {

namespace {

std::string active_pointer_path(const std::string& home) {
  return (std::filesystem::path(home) / "session.json").string();
}

}  // namespace

const std::vector<std::string>& canonical_roles() {
  static const std::vector<std::string> roles{"developer", "observer", "reviewer", "stakeholder"};
  return roles;
}

bool is_canonical_role(const std::string& role) {
  for (const auto& r : canonical_roles()) {
    if (r == role) return true;
  }
  return false;
}

std::string session_to_json(const SessionState& s, bool redact_token) {
  jsonlite::Object o;
  const auto str = [](const std::string& v) { return jsonlite::Value{v}; };
  o["mission_id"] = str(s.mission_id);
  o["mission_run_id"] = str(s.mission_run_id);
  o["participant_id"] = str(s.participant_id);
  o["role"] = str(s.role);
  o["joined_at"] = str(s.joined_at);
  o["last_activity_at"] = str(s.last_activity_at);
  o["drive_intent"] = str(to_string(s.drive_intent));
  o["focus"] = s.focus ? str(format_focus(*s.focus)) : jsonlite::Value{nullptr};
  o["session_token"] = str(redact_token && !s.session_token.empty() ? "***" : s.session_token);
  o["api_url"] = str(s.api_url);
  return jsonlite::to_json(o);
}

std::optional<SessionState> session_from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->message;
    return std::nullopt;
  }
  using jsonlite::get_string;
  SessionState s;
  s.mission_id = get_string(o, "mission_id");
  s.mission_run_id = get_string(o, "mission_run_id");
  s.participant_id = get_string(o, "participant_id");
  s.role = get_string(o, "role");
  s.joined_at = get_string(o, "joined_at");
  s.last_activity_at = get_string(o, "last_activity_at");
  s.drive_intent = parse_drive_intent(get_string(o, "drive_intent", "inactive"))
                       .value_or(DriveIntent::inactive);
  const std::string focus = get_string(o, "focus");
  if (!focus.empty() && focus != "none") {
    s.focus = parse_focus(focus);
    if (!s.focus) {
      if (error) *error = "invalid focus format: " + focus;
      return std::nullopt;
    }
  }
  s.session_token = get_string(o, "session_token");
  s.api_url = get_string(o, "api_url");
  if (s.mission_id.empty() || s.participant_id.empty()) {
    if (error) *error = "session missing mission_id or participant_id";
    return std::nullopt;
  }
  return s;
}

std::vector<std::string> validate_integrity(const SessionState& s) {
  std::vector<std::string> errors;

  const auto joined = parse_iso8601(s.joined_at);
  const auto active = parse_iso8601(s.last_activity_at);
  if (!joined || !active) {
    errors.push_back("invalid timestamps: joined_at=" + s.joined_at +
                     " last_activity_at=" + s.last_activity_at);
  } else if (*joined > *active) {
    errors.push_back("temporal violation: joined_at (" + s.joined_at +
                     ") > last_activity_at (" + s.last_activity_at + ")");
  }

  if (!is_valid_id(s.participant_id)) {
    errors.push_back("invalid participant_id format: " + s.participant_id);
  }

  if (s.role.empty()) {
    errors.push_back("invalid role: role label is empty");
  } else if (!is_canonical_role(s.role)) {
    errors.push_back("invalid role: '" + s.role +
                     "' not in canonical taxonomy (developer, observer, reviewer, stakeholder)");
  }

  if (s.focus && s.focus->id.empty()) {
    errors.push_back("invalid focus: empty target id");
  }
  return errors;
}

SessionStore::SessionStore(std::string home) : home_(std::move(home)) {}

std::string SessionStore::session_path(const std::string& mission_id) const {
  return (std::filesystem::path(home_) / "missions" / mission_id / "session.json").string();
}

std::optional<SessionState> SessionStore::load(const std::string& mission_id) const {
  if (!is_valid_stream_id(mission_id)) return std::nullopt;
  const auto text = read_file(session_path(mission_id));
  if (!text) return std::nullopt;
  std::string err;
  auto s = session_from_json(*text, &err);
  if (!s) {
    log_warn("session", "ignoring corrupt session file",
             {{"mission_id", mission_id}, {"error", err}});
  }
  return s;
}

OpError SessionStore::save(const std::string& mission_id, const SessionState& state) {
  if (!is_valid_stream_id(mission_id)) {
    return OpError{ErrorCode::invalid_input, "invalid mission id: " + mission_id};
  }
  std::string err;
  if (!atomic_write(session_path(mission_id), session_to_json(state, false), &err,
                    /*owner_only=*/true)) {
    return OpError{ErrorCode::io_failure, err};
  }
  return {};
}

OpError SessionStore::update(const std::string& mission_id,
                             const std::function<void(SessionState&)>& mutate) {
  auto s = load(mission_id);
  if (!s) return OpError{ErrorCode::not_joined, "not joined to mission " + mission_id};
  mutate(*s);
  return save(mission_id, *s);
}

std::optional<SessionState> SessionStore::ensure_joined(const std::string& mission_id,
                                                        OpError* error) const {
  auto s = load(mission_id);
  if (!s) {
    if (error) {
      *error = OpError{ErrorCode::not_joined,
                       "not joined to mission " + mission_id +
                           "; run: concord join " + mission_id + " --role <role>"};
    }
    return std::nullopt;
  }
  const auto problems = validate_integrity(*s);
  if (!problems.empty()) {
    std::string msg = "session validation failed:";
    for (const auto& p : problems) msg += " " + p + ";";
    if (error) *error = OpError{ErrorCode::not_joined, msg};
    return std::nullopt;
  }
  return s;
}

OpError SessionStore::set_active_mission(const std::string& mission_id) {
  jsonlite::Object o;
  o["active_mission_id"] = jsonlite::Value{mission_id};
  o["last_switched_at"] = jsonlite::Value{format_iso8601(now_unix_ms())};
  std::string err;
  if (!atomic_write(active_pointer_path(home_), jsonlite::to_json(o), &err)) {
    return OpError{ErrorCode::io_failure, err};
  }
  return {};
}

std::optional<std::string> SessionStore::active_mission() const {
  const auto text = read_file(active_pointer_path(home_));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  const std::string id = jsonlite::get_string(o, "active_mission_id");
  if (id.empty()) return std::nullopt;
  return id;
}

std::optional<std::string> SessionStore::resolve_mission_id(
    const std::optional<std::string>& explicit_id, OpError* error) const {
  if (explicit_id && !explicit_id->empty()) return explicit_id;
  if (auto active = active_mission()) return active;
  if (error) {
    *error = OpError{ErrorCode::no_active_mission,
                     "no active mission; pass --mission <id> or run: concord join <mission> --role <role>"};
  }
  return std::nullopt;
}

}  // namespace concord
