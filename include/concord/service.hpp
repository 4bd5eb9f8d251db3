#pragma once

// concord/service.hpp — Collaboration use-cases over the event core.
//
// Every operation follows the same shape:
//   1. resolve the cached session (everything except join requires one)
//   2. validate input; invalid_input aborts before any write
//   3. consult the roster / collision detector where the operation needs it
//   4. persist the updated session
//   5. emit: under the stream lock, Lamport increment → envelope → durable
//      append; then one immediate delivery attempt
//   Join runs 5 before 4, since no session exists before the joined event.
//
// DESIGN INVARIANTS:
//   - Local failures (io_failure, invalid_input, not_joined) abort the
//     operation; nothing after the failed step happens. A failed append
//     restores the previously cached session.
//   - Network problems never fail an operation. An event that could not be
//     delivered immediately stays pending and the result carries `queued`.
//   - Definitive rejections surface on the next status() as warnings.
//   - Self-transitions (same focus, same drive intent) emit nothing.
//
// All collaborators are explicit handles owned by the caller; the service
// holds references only.

#include <optional>
#include <string>
#include <vector>

#include "concord/collision.hpp"
#include "concord/config.hpp"
#include "concord/ingest_client.hpp"
#include "concord/lamport.hpp"
#include "concord/queue_store.hpp"
#include "concord/replay.hpp"
#include "concord/roster.hpp"
#include "concord/session.hpp"

namespace concord {

struct ServiceDeps {
  EventQueueStore& queue;
  LamportClock&    clock;
  SessionStore&    sessions;
  IIngestClient&   client;
  RetryPolicy      policy;
  Sleeper          sleeper;
  Config           config;
};

struct ServiceResult {
  bool    ok{false};
  OpError error;
  bool    noop{false};                       // self-transition, nothing emitted
  bool    queued{false};                     // an emitted event awaits delivery
  std::vector<std::string> emitted;          // event ids in emission order
  std::vector<std::string> rejected;         // emitted events rejected on delivery

  std::string mission_id;
  std::string participant_id;
  std::string record_id;                     // comment_id / decision_id
  std::optional<DriveIntent> drive_intent;
  std::optional<std::string> focus;          // "wp:.." / "step:.." / "none"
  std::optional<CollisionWarning> collision; // drive-set suspended pending ack
};

std::string service_result_to_json(const ServiceResult& r);

struct StatusReport {
  bool    ok{false};
  OpError error;
  std::string mission_id;
  SessionState session;
  Roster roster;
  QueueSummary queue;
  uint64_t logical_clock{0};
  std::vector<std::string> warnings;
};

std::string status_report_to_json(const StatusReport& r);

struct SyncResult {
  bool    ok{false};
  OpError error;
  std::string mission_id;
  ReplayReport report;
};

std::string sync_result_to_json(const SyncResult& r);

struct RequeueResult {
  bool    ok{false};
  OpError error;
  std::string mission_id;
  uint64_t requeued{0};
};

class CollaborationService {
 public:
  explicit CollaborationService(ServiceDeps deps);

  ServiceResult join_mission(const std::string& mission_id, const std::string& role);

  // `focus` is "wp:<id>", "step:<id>" or "none".
  ServiceResult set_focus(const std::string& mission_id, const std::string& focus);

  // inactive → active runs the collision check unless `bypass_check`.
  ServiceResult set_drive(const std::string& mission_id, DriveIntent intent,
                          bool bypass_check = false);

  ServiceResult acknowledge(const std::string& mission_id, const std::string& warning_id,
                            const std::string& action);

  ServiceResult post_comment(const std::string& mission_id, const std::string& text,
                             const std::optional<std::string>& reply_to = std::nullopt);

  ServiceResult capture_decision(const std::string& mission_id, const std::string& text,
                                 const std::optional<std::string>& rationale = std::nullopt,
                                 const std::optional<std::string>& referenced_warning_id = std::nullopt);

  StatusReport status(const std::string& mission_id);

  SyncResult sync(const std::string& mission_id, size_t batch_size = 0);

  RequeueResult requeue_failed(const std::string& mission_id);

 private:
  // Append + deliver one event stamped with session.last_activity_at. Fills
  // result->emitted / queued / rejected.
  OpError emit(const SessionState& session, EventType type, EventPayload payload,
               const std::optional<std::string>& causation_id, ServiceResult* result,
               const std::string& event_id = "");

  // Persist `next` (with a fresh last_activity_at), then emit. A failed emit
  // restores `prior` on disk and in `next`.
  OpError commit(const SessionState& prior, SessionState& next, EventType type,
                 EventPayload payload, const std::optional<std::string>& causation_id,
                 ServiceResult* result, const std::string& event_id = "");

  ServiceResult begin(const std::string& mission_id, std::optional<SessionState>* session);

  OpError persist_session(const SessionState& session);

  ServiceDeps deps_;
  ReplayTransport transport_;
};

}  // namespace concord
