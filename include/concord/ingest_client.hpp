#pragma once

// concord/ingest_client.hpp — Remote ingestion / mission service client.
//
// Consumed contract:
//   POST <api>/api/v1/events/batch/            {"events":[envelope...]}
//     → {"results":[{"event_id","status","reason"}]}
//       status ∈ accepted | duplicate | rejected
//     legacy → {"accepted":[ids],"rejected":[ids]}
//   GET  <api>/health                          200 = online
//   POST <api>/api/v1/missions/<m>/participants {"role"}
//     → {"participant_id","session_token","mission_run_id","display_name"}
//
// Batch submissions are idempotent on the server side (duplicate event ids
// are deduplicated) and carry an Idempotency-Key header derived from the
// batch's event ids, so a timeout followed by a retry never double-counts.
//
// Classification of a batch attempt:
//   ok            2xx, or 4xx carrying per-event verdicts
//   transient     connection error, timeout, 408, 429, 5xx, unparseable 2xx
//   unauthorized  401 / 403: credentials problem, the events themselves are
//                 not at fault. Not retried, entries stay pending.
//   rejected      any other 4xx without verdicts: the batch is invalid.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "concord/event.hpp"
#include "concord/types.hpp"

namespace concord {

enum class VerdictStatus { accepted, duplicate, rejected };
std::string to_string(VerdictStatus status);

struct EventVerdict {
  VerdictStatus status{VerdictStatus::accepted};
  std::string   reason;
};

enum class BatchOutcome { ok, transient, unauthorized, rejected };
std::string to_string(BatchOutcome outcome);

struct BatchResponse {
  BatchOutcome outcome{BatchOutcome::transient};
  long         http_status{0};
  std::map<std::string, EventVerdict> verdicts;   // event_id → verdict
  std::string  error;
};

struct JoinResponse {
  bool        ok{false};
  ErrorCode   code{ErrorCode::none};
  std::string message;
  std::string participant_id;
  std::string session_token;
  std::string mission_run_id;
  std::string display_name;
};

// Interpret one HTTP exchange. `transport_error` non-empty means the request
// never produced an HTTP status (connect failure, timeout).
BatchResponse classify_batch_response(long http_status, const std::string& body,
                                      const std::string& transport_error);

JoinResponse parse_join_response(long http_status, const std::string& body,
                                 const std::string& transport_error);

std::string batch_request_body(const std::vector<EventEnvelope>& events);

// ---------------------------------------------------------------------------
// IIngestClient: abstract remote boundary. Tests substitute a scripted fake.
// ---------------------------------------------------------------------------
class IIngestClient {
 public:
  virtual ~IIngestClient() = default;

  virtual bool health() = 0;

  virtual BatchResponse submit_batch(const std::vector<EventEnvelope>& events,
                                     const std::string& bearer_token) = 0;

  virtual JoinResponse join_mission(const std::string& mission_id, const std::string& role,
                                    const std::string& bearer_token) = 0;
};

struct HttpClientOptions {
  std::string api_url;
  uint32_t    timeout_ms{10000};
  uint32_t    connect_timeout_ms{3000};
};

// libcurl implementation. One easy handle per request; no shared state.
class HttpIngestClient : public IIngestClient {
 public:
  explicit HttpIngestClient(HttpClientOptions options);
  ~HttpIngestClient() override;

  HttpIngestClient(const HttpIngestClient&) = delete;
  HttpIngestClient& operator=(const HttpIngestClient&) = delete;

  bool health() override;
  BatchResponse submit_batch(const std::vector<EventEnvelope>& events,
                             const std::string& bearer_token) override;
  JoinResponse join_mission(const std::string& mission_id, const std::string& role,
                            const std::string& bearer_token) override;

 private:
  struct HttpResult {
    long        status{0};
    std::string body;
    std::string transport_error;
  };

  HttpResult perform(const std::string& url, const std::string* post_body,
                     const std::vector<std::string>& headers) const;

  HttpClientOptions options_;
};

}  // namespace concord
