#include "concord/service.hpp"

#include <sstream>

#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"
#include "concord/ulid.hpp"

namespace concord {

namespace {

std::string error_json(const OpError& e) {
  return "{\"code\":\"" + to_string(e.code) + "\",\"message\":\"" +
         jsonlite::escape(e.message) + "\"}";
}

void ids_json(std::ostringstream& o, const std::vector<std::string>& ids) {
  o << "[";
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(ids[i]) << "\"";
  }
  o << "]";
}

ServiceResult fail(ServiceResult r, OpError e) {
  r.ok = false;
  r.error = std::move(e);
  return r;
}

bool blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::string service_result_to_json(const ServiceResult& r) {
  using jsonlite::escape;
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false");
  if (r.error) o << ",\"error\":" << error_json(r.error);
  if (!r.mission_id.empty()) o << ",\"mission_id\":\"" << escape(r.mission_id) << "\"";
  if (!r.participant_id.empty()) o << ",\"participant_id\":\"" << escape(r.participant_id) << "\"";
  if (!r.record_id.empty()) o << ",\"id\":\"" << escape(r.record_id) << "\"";
  if (r.drive_intent) o << ",\"drive_intent\":\"" << to_string(*r.drive_intent) << "\"";
  if (r.focus) o << ",\"focus\":\"" << escape(*r.focus) << "\"";
  if (r.noop) o << ",\"noop\":true";
  if (r.collision) o << ",\"collision\":" << collision_warning_to_json(*r.collision);
  o << ",\"emitted\":";
  ids_json(o, r.emitted);
  if (!r.rejected.empty()) {
    o << ",\"rejected\":";
    ids_json(o, r.rejected);
  }
  o << ",\"queued\":" << (r.queued ? "true" : "false");
  if (r.queued) o << ",\"advisory\":\"queued; will sync when online\"";
  o << "}";
  return o.str();
}

std::string status_report_to_json(const StatusReport& r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false");
  if (r.error) {
    o << ",\"error\":" << error_json(r.error) << "}";
    return o.str();
  }
  o << ",\"mission_id\":\"" << jsonlite::escape(r.mission_id) << "\""
    << ",\"session\":" << session_to_json(r.session)
    << ",\"participants\":" << roster_to_json(r.roster)
    << ",\"queue\":" << queue_summary_to_json(r.queue)
    << ",\"logical_clock\":" << r.logical_clock
    << ",\"warnings\":";
  ids_json(o, r.warnings);
  o << "}";
  return o.str();
}

std::string sync_result_to_json(const SyncResult& r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false");
  if (r.error) o << ",\"error\":" << error_json(r.error);
  if (!r.mission_id.empty()) o << ",\"mission_id\":\"" << jsonlite::escape(r.mission_id) << "\"";
  o << ",\"replay\":" << replay_report_to_json(r.report) << "}";
  return o.str();
}

CollaborationService::CollaborationService(ServiceDeps deps)
    : deps_(std::move(deps)),
      transport_(deps_.queue, deps_.client, deps_.policy, deps_.sleeper) {}

ServiceResult CollaborationService::begin(const std::string& mission_id,
                                          std::optional<SessionState>* session) {
  ServiceResult r;
  r.mission_id = mission_id;
  OpError err;
  *session = deps_.sessions.ensure_joined(mission_id, &err);
  if (!*session) return fail(std::move(r), err);
  r.participant_id = (*session)->participant_id;
  r.ok = true;
  return r;
}

OpError CollaborationService::persist_session(const SessionState& session) {
  return deps_.sessions.save(session.mission_id, session);
}

OpError CollaborationService::emit(const SessionState& session, EventType type,
                                   EventPayload payload,
                                   const std::optional<std::string>& causation_id,
                                   ServiceResult* result, const std::string& event_id) {
  if (OpError e = validate_payload(type, payload)) return e;

  // The clock advances under the stream lock, so a second process on this
  // node cannot slip a lower stamp in behind ours.
  OpError err;
  auto env = deps_.queue.append_stamped(
      session.mission_id,
      [&](OpError* stamp_err) -> std::optional<EventEnvelope> {
        std::string clock_err;
        const auto lamport = deps_.clock.increment(&clock_err);
        if (!lamport) {
          *stamp_err = {ErrorCode::io_failure, "clock persistence failed: " + clock_err};
          return std::nullopt;
        }
        EnvelopeMeta meta;
        meta.event_id = event_id.empty() ? generate_id() : event_id;
        meta.origin_node = deps_.clock.node_id();
        meta.logical_clock = *lamport;
        meta.timestamp = session.last_activity_at;
        meta.causation_id = causation_id;
        return make_envelope(type, std::move(payload), meta, stamp_err);
      },
      &err);
  if (!env) return err;
  result->emitted.push_back(env->event_id);

  const DeliveryResult d = transport_.deliver_now(session.mission_id, *env, session.session_token);
  if (d.error) {
    log_warn("service", "delivery verdict not persisted",
             {{"event_id", env->event_id}, {"error", d.error.message}});
  }
  if (d.state == DeliveryState::queued) result->queued = true;
  if (d.state == DeliveryState::rejected) {
    result->rejected.push_back(env->event_id);
    log_warn("service", "event rejected on delivery",
             {{"event_id", env->event_id}, {"reason", d.reason}});
  }
  return {};
}

OpError CollaborationService::commit(const SessionState& prior, SessionState& next, EventType type,
                                     EventPayload payload,
                                     const std::optional<std::string>& causation_id,
                                     ServiceResult* result, const std::string& event_id) {
  next.last_activity_at = format_iso8601(now_unix_ms());
  if (OpError e = persist_session(next)) {
    next = prior;
    return e;
  }
  if (OpError e = emit(next, type, std::move(payload), causation_id, result, event_id)) {
    if (OpError restore = persist_session(prior)) {
      log_event(LogLevel::error, "service", "session rollback failed",
                {{"mission_id", prior.mission_id}, {"error", restore.message}});
    }
    next = prior;
    return e;
  }
  return {};
}

ServiceResult CollaborationService::join_mission(const std::string& mission_id,
                                                 const std::string& role) {
  ServiceResult r;
  r.mission_id = mission_id;
  if (!is_valid_stream_id(mission_id)) {
    return fail(std::move(r), {ErrorCode::invalid_input, "invalid mission id: " + mission_id});
  }
  if (!is_canonical_role(role)) {
    return fail(std::move(r), {ErrorCode::invalid_input,
                               "invalid role '" + role +
                                   "' (developer, observer, reviewer, stakeholder)"});
  }
  if (deps_.config.auth_token.empty()) {
    return fail(std::move(r), {ErrorCode::invalid_input, "CONCORD_AUTH_TOKEN is not set"});
  }

  const JoinResponse resp = deps_.client.join_mission(mission_id, role, deps_.config.auth_token);
  if (!resp.ok) return fail(std::move(r), {resp.code, resp.message});
  if (!is_valid_id(resp.participant_id)) {
    return fail(std::move(r), {ErrorCode::join_failed,
                               "service issued a malformed participant_id: " + resp.participant_id});
  }

  const std::string now = format_iso8601(now_unix_ms());
  SessionState s;
  s.mission_id = mission_id;
  s.mission_run_id = resp.mission_run_id;
  s.participant_id = resp.participant_id;
  s.role = role;
  s.joined_at = now;
  s.last_activity_at = now;
  s.session_token = resp.session_token.empty() ? deps_.config.auth_token : resp.session_token;
  s.api_url = deps_.config.api_url;

  ParticipantJoinedPayload p;
  p.participant_id = s.participant_id;
  p.mission_id = mission_id;
  p.role = role;
  if (!resp.display_name.empty()) p.display_name = resp.display_name;
  // The joined event goes first. A session is only cached for a participant
  // the roster will know; a repeated join after a later failure folds as a
  // duplicate.
  if (OpError e = emit(s, EventType::participant_joined, std::move(p), std::nullopt, &r)) {
    return fail(std::move(r), e);
  }
  if (OpError e = persist_session(s)) return fail(std::move(r), e);
  if (OpError e = deps_.sessions.set_active_mission(mission_id)) return fail(std::move(r), e);

  r.ok = true;
  r.participant_id = s.participant_id;
  r.drive_intent = s.drive_intent;
  r.focus = format_focus(s.focus);
  return r;
}

ServiceResult CollaborationService::set_focus(const std::string& mission_id,
                                              const std::string& focus) {
  std::optional<SessionState> s;
  ServiceResult r = begin(mission_id, &s);
  if (!r.ok) return r;

  std::optional<FocusTarget> target;
  if (focus != "none") {
    target = parse_focus(focus);
    if (!target) {
      return fail(std::move(r), {ErrorCode::invalid_input,
                                 "invalid focus '" + focus + "' (expected wp:<id>, step:<id> or none)"});
    }
  }
  r.focus = format_focus(target);
  r.drive_intent = s->drive_intent;
  if (target == s->focus) {
    r.noop = true;
    return r;
  }

  const SessionState prior = *s;
  FocusChangedPayload p{s->participant_id, mission_id, target, s->focus};
  s->focus = target;
  if (OpError e = commit(prior, *s, EventType::focus_changed, std::move(p), std::nullopt, &r)) {
    return fail(std::move(r), e);
  }
  return r;
}

ServiceResult CollaborationService::set_drive(const std::string& mission_id, DriveIntent intent,
                                              bool bypass_check) {
  std::optional<SessionState> s;
  ServiceResult r = begin(mission_id, &s);
  if (!r.ok) return r;

  r.focus = format_focus(s->focus);
  if (intent == s->drive_intent) {
    r.noop = true;
    r.drive_intent = intent;
    return r;
  }

  if (intent == DriveIntent::active && !bypass_check) {
    SessionState& session = *s;
    CollisionDetector detector(
        deps_.queue, [&](EventType type, EventPayload payload, const std::string& id) {
          const SessionState prior = session;
          return commit(prior, session, type, std::move(payload), std::nullopt, &r, id);
        });
    DetectResult detected = detector.detect(mission_id, s->participant_id, s->focus);
    if (detected.error) return fail(std::move(r), detected.error);
    if (detected.warning) {
      r.collision = std::move(detected.warning);
      r.drive_intent = s->drive_intent;
      return r;
    }
  }

  const SessionState prior = *s;
  DriveIntentSetPayload p{s->participant_id, mission_id, intent};
  s->drive_intent = intent;
  if (OpError e =
          commit(prior, *s, EventType::drive_intent_set, std::move(p), std::nullopt, &r)) {
    return fail(std::move(r), e);
  }
  r.drive_intent = intent;
  return r;
}

ServiceResult CollaborationService::acknowledge(const std::string& mission_id,
                                                const std::string& warning_id,
                                                const std::string& action) {
  ServiceResult r;
  r.mission_id = mission_id;
  const auto parsed = parse_ack_action(action);
  if (!parsed) {
    return fail(std::move(r), {ErrorCode::invalid_input,
                               "invalid acknowledgement '" + action +
                                   "' (continue, hold, reassign, defer)"});
  }
  if (!is_valid_id(warning_id)) {
    return fail(std::move(r), {ErrorCode::invalid_input, "invalid warning id: " + warning_id});
  }

  std::optional<SessionState> s;
  r = begin(mission_id, &s);
  if (!r.ok) return r;

  WarningAcknowledgedPayload ack{s->participant_id, mission_id, warning_id, *parsed};
  if (OpError e = commit(SessionState(*s), *s, EventType::warning_acknowledged, std::move(ack),
                         warning_id, &r)) {
    return fail(std::move(r), e);
  }
  const std::string ack_event_id = r.emitted.back();
  r.drive_intent = s->drive_intent;
  r.focus = format_focus(s->focus);

  switch (*parsed) {
    case AckAction::continue_: {
      ServiceResult drive = set_drive(mission_id, DriveIntent::active, /*bypass_check=*/true);
      if (!drive.ok) return fail(std::move(r), drive.error);
      r.emitted.insert(r.emitted.end(), drive.emitted.begin(), drive.emitted.end());
      r.rejected.insert(r.rejected.end(), drive.rejected.begin(), drive.rejected.end());
      r.queued = r.queued || drive.queued;
      r.drive_intent = drive.drive_intent;
      break;
    }
    case AckAction::reassign: {
      // Mention everyone the warning named except ourselves.
      std::vector<std::string> mentions;
      std::string where = "warning " + warning_id;
      if (const auto warning = deps_.queue.find(mission_id, warning_id)) {
        if (const auto* c = std::get_if<CollisionPayload>(&warning->event.payload)) {
          for (const auto& pid : c->participant_ids) {
            if (pid != s->participant_id) mentions.push_back(pid);
          }
          if (c->focus_target) where = format_focus(*c->focus_target);
        }
      }
      std::string text = "Reassignment suggested for " + where + ":";
      for (const auto& m : mentions) text += " @" + m;
      if (mentions.empty()) text += " please coordinate";

      CommentPostedPayload comment{s->participant_id, mission_id, generate_id(),
                                   truncate_utf8(text, kMaxCommentLength), std::nullopt, mentions};
      r.record_id = comment.comment_id;
      if (OpError e = commit(SessionState(*s), *s, EventType::comment_posted, std::move(comment),
                             ack_event_id, &r)) {
        return fail(std::move(r), e);
      }
      break;
    }
    case AckAction::hold:
    case AckAction::defer:
      break;
  }
  return r;
}

ServiceResult CollaborationService::post_comment(const std::string& mission_id,
                                                 const std::string& text,
                                                 const std::optional<std::string>& reply_to) {
  ServiceResult r;
  r.mission_id = mission_id;
  if (blank(text)) return fail(std::move(r), {ErrorCode::invalid_input, "comment must not be empty"});

  std::optional<SessionState> s;
  r = begin(mission_id, &s);
  if (!r.ok) return r;

  CommentPostedPayload p{s->participant_id, mission_id, generate_id(),
                         truncate_utf8(text, kMaxCommentLength), reply_to, {}};
  r.record_id = p.comment_id;
  if (OpError e = commit(SessionState(*s), *s, EventType::comment_posted, std::move(p),
                         std::nullopt, &r)) {
    return fail(std::move(r), e);
  }
  return r;
}

ServiceResult CollaborationService::capture_decision(
    const std::string& mission_id, const std::string& text,
    const std::optional<std::string>& rationale,
    const std::optional<std::string>& referenced_warning_id) {
  ServiceResult r;
  r.mission_id = mission_id;
  if (blank(text)) return fail(std::move(r), {ErrorCode::invalid_input, "decision must not be empty"});

  std::optional<SessionState> s;
  r = begin(mission_id, &s);
  if (!r.ok) return r;

  DecisionCapturedPayload p;
  p.participant_id = s->participant_id;
  p.mission_id = mission_id;
  p.decision_id = generate_id();
  p.topic = s->focus ? format_focus(*s->focus) : "mission";
  p.chosen_option = text;
  p.rationale = rationale;
  p.referenced_warning_id = referenced_warning_id;
  r.record_id = p.decision_id;
  r.focus = format_focus(s->focus);
  if (OpError e = commit(SessionState(*s), *s, EventType::decision_captured, std::move(p),
                         referenced_warning_id, &r)) {
    return fail(std::move(r), e);
  }
  return r;
}

StatusReport CollaborationService::status(const std::string& mission_id) {
  StatusReport report;
  report.mission_id = mission_id;
  auto s = deps_.sessions.ensure_joined(mission_id, &report.error);
  if (!s) return report;

  report.session = *s;
  report.roster = build_roster(deps_.queue, mission_id);
  report.queue = deps_.queue.summary(mission_id);
  report.logical_clock = deps_.clock.current();

  if (report.queue.failed > 0) {
    report.warnings.push_back(std::to_string(report.queue.failed) +
                              " event(s) rejected by the ingestion service; inspect with "
                              "`concord queue show` and re-send with `concord requeue`");
  }
  if (report.queue.pending > 0) {
    report.warnings.push_back(std::to_string(report.queue.pending) +
                              " event(s) queued; run `concord sync` when online");
  }
  report.ok = true;
  return report;
}

SyncResult CollaborationService::sync(const std::string& mission_id, size_t batch_size) {
  SyncResult out;
  out.mission_id = mission_id;
  auto s = deps_.sessions.ensure_joined(mission_id, &out.error);
  if (!s) return out;

  if (batch_size == 0) batch_size = deps_.config.batch_size;
  out.report = transport_.replay(mission_id, s->session_token, batch_size);
  if (out.report.error) {
    out.error = out.report.error;
    return out;
  }
  out.ok = true;
  return out;
}

RequeueResult CollaborationService::requeue_failed(const std::string& mission_id) {
  RequeueResult out;
  out.mission_id = mission_id;
  if (!deps_.sessions.ensure_joined(mission_id, &out.error)) return out;

  const auto moved = deps_.queue.requeue_failed(mission_id, &out.error);
  if (!moved) return out;
  out.requeued = *moved;
  out.ok = true;
  log_info("service", "failed events requeued",
           {{"mission_id", mission_id}, {"count", std::to_string(*moved)}});
  return out;
}

}  // namespace concord
