#pragma once

// concord/session.hpp — Local cache of the remotely issued participant
// identity, one file per mission, plus an "active mission" pointer.
//
//   <home>/missions/<mission_id>/session.json   (mode 0600, holds the token)
//   <home>/session.json                         active mission pointer
//
// The participant id is minted by the mission service at join time. This
// engine never generates participant identity; every domain operation other
// than join requires a cached session (ensure_joined).
//
// Writes are atomic (temp + fsync + rename). A missing or unreadable session
// file means "not joined"; corruption is logged.

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "concord/event.hpp"
#include "concord/types.hpp"

namespace concord {

// Canonical role taxonomy.
bool is_canonical_role(const std::string& role);
const std::vector<std::string>& canonical_roles();

struct SessionState {
  std::string mission_id;
  std::string mission_run_id;
  std::string participant_id;
  std::string role;
  std::string joined_at;           // ISO-8601
  std::string last_activity_at;    // ISO-8601
  DriveIntent drive_intent{DriveIntent::inactive};
  std::optional<FocusTarget> focus;
  std::string session_token;
  std::string api_url;
};

std::string session_to_json(const SessionState& s, bool redact_token = true);
std::optional<SessionState> session_from_json(const std::string& text, std::string* error);

// Temporal order, participant id format, canonical role. Empty when valid.
std::vector<std::string> validate_integrity(const SessionState& s);

class SessionStore {
 public:
  explicit SessionStore(std::string home);

  std::string session_path(const std::string& mission_id) const;

  std::optional<SessionState> load(const std::string& mission_id) const;
  OpError save(const std::string& mission_id, const SessionState& state);

  // Load, mutate, save. not_joined when no session exists.
  OpError update(const std::string& mission_id, const std::function<void(SessionState&)>& mutate);

  // Cached session that passes validate_integrity(), or not_joined.
  std::optional<SessionState> ensure_joined(const std::string& mission_id, OpError* error) const;

  OpError set_active_mission(const std::string& mission_id);
  std::optional<std::string> active_mission() const;

  // Explicit id wins; otherwise the active pointer; otherwise no_active_mission.
  std::optional<std::string> resolve_mission_id(const std::optional<std::string>& explicit_id,
                                                OpError* error) const;

 private:
  std::string home_;
};

}  // namespace concord
