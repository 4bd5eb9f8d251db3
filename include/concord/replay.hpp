#pragma once

// concord/replay.hpp — Batched replay of pending queue entries to the
// ingestion service.
//
// Verdict handling per event:
//   accepted / duplicate       → delivered
//   rejected (reason)          → failed, retry_count unchanged, never retried
//                                automatically (operator requeue only)
//   no verdict in a response   → stays pending
// Batch-level handling:
//   transient, retries left    → sleep(policy.delay_for(attempt)), resend the
//                                identical batch (same Idempotency-Key)
//   transient, exhausted       → every entry stays pending, retry_count + 1,
//                                last_retry_at stamped; reported as deferred
//   unauthorized               → as exhausted transient, without retrying
//   rejected (4xx, no verdicts)→ every entry failed
// Verdicts are persisted with update_status() after each batch. A timeout
// never marks an entry failed.

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "concord/ingest_client.hpp"
#include "concord/queue_store.hpp"

namespace concord {

constexpr size_t kDefaultBatchSize = 100;

struct RetryPolicy {
  uint32_t max_attempts{3};      // total sends per batch, including the first
  uint32_t base_delay_ms{1000};
  uint32_t max_delay_ms{30000};

  // Delay after failed attempt `attempt` (0-based): base * 2^attempt, capped.
  std::chrono::milliseconds delay_for(uint32_t attempt) const;

  static RetryPolicy zero_delay(uint32_t max_attempts = 3);
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;
Sleeper thread_sleeper();

struct ReplayReport {
  std::vector<std::string> accepted;   // includes duplicates
  std::vector<std::string> rejected;
  std::vector<std::string> deferred;
  uint32_t batches{0};
  uint32_t attempts{0};
  OpError  error;                      // io_failure while persisting verdicts
};

std::string replay_report_to_json(const ReplayReport& r);

enum class DeliveryState { delivered, queued, rejected };
std::string to_string(DeliveryState state);

struct DeliveryResult {
  DeliveryState state{DeliveryState::queued};
  std::string   reason;
  OpError       error;
};

class ReplayTransport {
 public:
  ReplayTransport(EventQueueStore& store, IIngestClient& client, RetryPolicy policy,
                  Sleeper sleeper = thread_sleeper());

  ReplayReport replay(const std::string& stream_id, const std::string& bearer_token,
                      size_t max_batch_size = kDefaultBatchSize);

  // One immediate attempt for a freshly appended event, no retries. When the
  // service is offline or the attempt fails transiently the entry stays
  // pending untouched.
  DeliveryResult deliver_now(const std::string& stream_id, const EventEnvelope& envelope,
                             const std::string& bearer_token);

 private:
  BatchResponse send_with_retry(const std::vector<EventEnvelope>& events,
                                const std::string& bearer_token, ReplayReport* report);

  EventQueueStore& store_;
  IIngestClient& client_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

}  // namespace concord
