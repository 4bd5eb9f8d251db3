#include "concord/replay.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"

namespace concord {

namespace {

void append_ids(std::ostringstream& o, const char* key, const std::vector<std::string>& ids) {
  o << "\"" << key << "\":[";
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(ids[i]) << "\"";
  }
  o << "]";
}

}  // namespace

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t attempt) const {
  uint64_t delay = base_delay_ms;
  for (uint32_t i = 0; i < attempt && delay < max_delay_ms; ++i) delay *= 2;
  return std::chrono::milliseconds(std::min<uint64_t>(delay, max_delay_ms));
}

RetryPolicy RetryPolicy::zero_delay(uint32_t max_attempts) {
  RetryPolicy p;
  p.max_attempts = max_attempts;
  p.base_delay_ms = 0;
  p.max_delay_ms = 0;
  return p;
}

Sleeper thread_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

std::string replay_report_to_json(const ReplayReport& r) {
  std::ostringstream o;
  o << "{";
  append_ids(o, "accepted", r.accepted);
  o << ",";
  append_ids(o, "rejected", r.rejected);
  o << ",";
  append_ids(o, "deferred", r.deferred);
  o << ",\"batches\":" << r.batches
    << ",\"attempts\":" << r.attempts;
  if (r.error) {
    o << ",\"error\":{\"code\":\"" << to_string(r.error.code) << "\",\"message\":\""
      << jsonlite::escape(r.error.message) << "\"}";
  }
  o << "}";
  return o.str();
}

std::string to_string(DeliveryState state) {
  switch (state) {
    case DeliveryState::delivered: return "delivered";
    case DeliveryState::queued:    return "queued";
    case DeliveryState::rejected:  return "rejected";
  }
  return "queued";
}

ReplayTransport::ReplayTransport(EventQueueStore& store, IIngestClient& client,
                                 RetryPolicy policy, Sleeper sleeper)
    : store_(store), client_(client), policy_(policy), sleeper_(std::move(sleeper)) {
  if (policy_.max_attempts == 0) policy_.max_attempts = 1;
}

BatchResponse ReplayTransport::send_with_retry(const std::vector<EventEnvelope>& events,
                                               const std::string& bearer_token,
                                               ReplayReport* report) {
  auto& stats = global_sync_stats();
  BatchResponse resp;
  for (uint32_t attempt = 0; attempt < policy_.max_attempts; ++attempt) {
    if (attempt > 0) {
      stats.retries.fetch_add(1, std::memory_order_relaxed);
      sleeper_(policy_.delay_for(attempt - 1));
    }
    ++report->attempts;
    stats.batches_sent.fetch_add(1, std::memory_order_relaxed);
    resp = client_.submit_batch(events, bearer_token);
    if (resp.outcome != BatchOutcome::transient) break;
    stats.transient_failures.fetch_add(1, std::memory_order_relaxed);
  }
  return resp;
}

ReplayReport ReplayTransport::replay(const std::string& stream_id,
                                     const std::string& bearer_token,
                                     size_t max_batch_size) {
  ReplayReport report;
  if (max_batch_size == 0) max_batch_size = kDefaultBatchSize;
  auto& stats = global_sync_stats();

  const std::vector<QueueEntry> pending = store_.read_pending(stream_id);
  for (size_t start = 0; start < pending.size(); start += max_batch_size) {
    const size_t end = std::min(pending.size(), start + max_batch_size);
    std::vector<EventEnvelope> events;
    events.reserve(end - start);
    for (size_t i = start; i < end; ++i) events.push_back(pending[i].event);

    ++report.batches;
    const BatchResponse resp = send_with_retry(events, bearer_token, &report);
    const std::string now = format_iso8601(now_unix_ms());

    std::map<std::string, StatusUpdate> updates;
    for (size_t i = start; i < end; ++i) {
      const QueueEntry& entry = pending[i];
      const std::string& id = entry.event.event_id;
      StatusUpdate u{entry.replay_status, entry.retry_count, entry.last_retry_at};

      switch (resp.outcome) {
        case BatchOutcome::ok: {
          auto it = resp.verdicts.find(id);
          if (it == resp.verdicts.end()) {
            report.deferred.push_back(id);
            continue;
          }
          if (it->second.status == VerdictStatus::rejected) {
            u.status = ReplayStatus::failed;
            report.rejected.push_back(id);
            stats.events_rejected.fetch_add(1, std::memory_order_relaxed);
            log_warn("replay", "event rejected",
                     {{"stream_id", stream_id}, {"event_id", id}, {"reason", it->second.reason}});
          } else {
            u.status = ReplayStatus::delivered;
            report.accepted.push_back(id);
            if (it->second.status == VerdictStatus::duplicate) {
              stats.events_duplicate.fetch_add(1, std::memory_order_relaxed);
            } else {
              stats.events_accepted.fetch_add(1, std::memory_order_relaxed);
            }
          }
          break;
        }
        case BatchOutcome::transient:
        case BatchOutcome::unauthorized:
          u.status = ReplayStatus::pending;
          u.retry_count = entry.retry_count + 1;
          u.last_retry_at = now;
          report.deferred.push_back(id);
          break;
        case BatchOutcome::rejected:
          u.status = ReplayStatus::failed;
          report.rejected.push_back(id);
          stats.events_rejected.fetch_add(1, std::memory_order_relaxed);
          break;
      }
      updates[id] = u;
    }

    if (resp.outcome != BatchOutcome::ok) {
      log_warn("replay", "batch not delivered",
               {{"stream_id", stream_id}, {"outcome", to_string(resp.outcome)},
                {"error", resp.error}, {"events", std::to_string(end - start)}});
    }

    if (OpError err = store_.update_status(stream_id, updates)) {
      report.error = err;
      return report;
    }
  }
  return report;
}

DeliveryResult ReplayTransport::deliver_now(const std::string& stream_id,
                                            const EventEnvelope& envelope,
                                            const std::string& bearer_token) {
  DeliveryResult result;
  if (!client_.health()) return result;

  auto& stats = global_sync_stats();
  stats.batches_sent.fetch_add(1, std::memory_order_relaxed);
  const BatchResponse resp = client_.submit_batch({envelope}, bearer_token);
  if (resp.outcome == BatchOutcome::transient) {
    stats.transient_failures.fetch_add(1, std::memory_order_relaxed);
  }

  StatusUpdate u;
  if (resp.outcome == BatchOutcome::ok) {
    auto it = resp.verdicts.find(envelope.event_id);
    if (it == resp.verdicts.end()) return result;
    if (it->second.status == VerdictStatus::rejected) {
      u.status = ReplayStatus::failed;
      result.state = DeliveryState::rejected;
      result.reason = it->second.reason;
      stats.events_rejected.fetch_add(1, std::memory_order_relaxed);
    } else {
      u.status = ReplayStatus::delivered;
      result.state = DeliveryState::delivered;
      if (it->second.status == VerdictStatus::duplicate) {
        stats.events_duplicate.fetch_add(1, std::memory_order_relaxed);
      } else {
        stats.events_accepted.fetch_add(1, std::memory_order_relaxed);
      }
    }
  } else if (resp.outcome == BatchOutcome::rejected) {
    u.status = ReplayStatus::failed;
    result.state = DeliveryState::rejected;
    result.reason = resp.error;
    stats.events_rejected.fetch_add(1, std::memory_order_relaxed);
  } else {
    return result;
  }

  if (OpError err = store_.update_status(stream_id, {{envelope.event_id, u}})) {
    result.state = DeliveryState::queued;
    result.error = err;
  }
  return result;
}

}  // namespace concord
