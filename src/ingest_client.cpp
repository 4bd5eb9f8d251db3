#include "concord/ingest_client.hpp"

#include <curl/curl.h>

#include <mutex>

#include "concord/hash.hpp"
#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"

namespace concord {

namespace {

bool is_transient_status(long status) {
  return status == 408 || status == 429 || status >= 500;
}

// Extract per-event verdicts from either response shape. Returns false when
// the body is not a JSON object.
bool parse_verdicts(const std::string& body, std::map<std::string, EventVerdict>* out) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(body, &err);
  if (err) return false;

  if (const auto results = jsonlite::get_array(obj, "results")) {
    for (const auto& item : *results) {
      const auto* r = std::get_if<jsonlite::Object>(&item.v);
      if (!r) continue;
      const std::string id = jsonlite::get_string(*r, "event_id");
      const std::string status = jsonlite::get_string(*r, "status");
      if (id.empty()) continue;
      EventVerdict v;
      if (status == "accepted") {
        v.status = VerdictStatus::accepted;
      } else if (status == "duplicate") {
        v.status = VerdictStatus::duplicate;
      } else if (status == "rejected") {
        v.status = VerdictStatus::rejected;
        v.reason = jsonlite::get_string(*r, "reason");
      } else {
        continue;  // unknown verdict: leave the event pending
      }
      (*out)[id] = v;
    }
    return true;
  }

  // Legacy shape.
  for (const auto& id : jsonlite::get_string_array(obj, "accepted")) {
    (*out)[id] = EventVerdict{VerdictStatus::accepted, ""};
  }
  for (const auto& id : jsonlite::get_string_array(obj, "rejected")) {
    (*out)[id] = EventVerdict{VerdictStatus::rejected, "rejected"};
  }
  return true;
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

std::once_flag g_curl_init;

}  // namespace

std::string to_string(VerdictStatus status) {
  switch (status) {
    case VerdictStatus::accepted:  return "accepted";
    case VerdictStatus::duplicate: return "duplicate";
    case VerdictStatus::rejected:  return "rejected";
  }
  return "rejected";
}

std::string to_string(BatchOutcome outcome) {
  switch (outcome) {
    case BatchOutcome::ok:           return "ok";
    case BatchOutcome::transient:    return "transient";
    case BatchOutcome::unauthorized: return "unauthorized";
    case BatchOutcome::rejected:     return "rejected";
  }
  return "transient";
}

BatchResponse classify_batch_response(long http_status, const std::string& body,
                                      const std::string& transport_error) {
  BatchResponse r;
  r.http_status = http_status;

  if (!transport_error.empty() || http_status == 0) {
    r.outcome = BatchOutcome::transient;
    r.error = transport_error.empty() ? "no response" : transport_error;
    return r;
  }
  if (is_transient_status(http_status)) {
    r.outcome = BatchOutcome::transient;
    r.error = "HTTP " + std::to_string(http_status);
    return r;
  }
  if (http_status == 401 || http_status == 403) {
    r.outcome = BatchOutcome::unauthorized;
    r.error = "authentication failed (HTTP " + std::to_string(http_status) + ")";
    return r;
  }
  if (http_status >= 200 && http_status < 300) {
    if (!parse_verdicts(body, &r.verdicts)) {
      r.outcome = BatchOutcome::transient;
      r.error = "unparseable response body";
      return r;
    }
    r.outcome = BatchOutcome::ok;
    return r;
  }
  // Remaining 3xx/4xx: per-event verdicts win when present.
  if (parse_verdicts(body, &r.verdicts) && !r.verdicts.empty()) {
    r.outcome = BatchOutcome::ok;
    return r;
  }
  r.verdicts.clear();
  r.outcome = BatchOutcome::rejected;
  r.error = "HTTP " + std::to_string(http_status);
  return r;
}

JoinResponse parse_join_response(long http_status, const std::string& body,
                                 const std::string& transport_error) {
  JoinResponse r;
  if (!transport_error.empty() || http_status == 0) {
    r.code = ErrorCode::transient_network;
    r.message = transport_error.empty() ? "no response" : transport_error;
    return r;
  }
  if (http_status < 200 || http_status >= 300) {
    r.code = is_transient_status(http_status) ? ErrorCode::transient_network
                                              : ErrorCode::join_failed;
    r.message = "join rejected (HTTP " + std::to_string(http_status) + ")";
    return r;
  }
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(body, &err);
  if (err) {
    r.code = ErrorCode::join_failed;
    r.message = "unparseable join response: " + err->message;
    return r;
  }
  r.participant_id = jsonlite::get_string(obj, "participant_id");
  if (r.participant_id.empty()) {
    r.code = ErrorCode::join_failed;
    r.message = "join response missing participant_id";
    return r;
  }
  r.session_token = jsonlite::get_string(obj, "session_token");
  r.mission_run_id = jsonlite::get_string(obj, "mission_run_id");
  r.display_name = jsonlite::get_string(obj, "display_name");
  r.ok = true;
  return r;
}

std::string batch_request_body(const std::vector<EventEnvelope>& events) {
  std::string body = "{\"events\":[";
  for (size_t i = 0; i < events.size(); ++i) {
    if (i) body += ",";
    body += envelope_to_json(events[i]);
  }
  body += "]}";
  return body;
}

// ---------------------------------------------------------------------------
// HttpIngestClient
// ---------------------------------------------------------------------------

HttpIngestClient::HttpIngestClient(HttpClientOptions options) : options_(std::move(options)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpIngestClient::~HttpIngestClient() = default;

HttpIngestClient::HttpResult HttpIngestClient::perform(
    const std::string& url, const std::string* post_body,
    const std::vector<std::string>& headers) const {
  HttpResult result;
  CURL* curl = curl_easy_init();
  if (!curl) {
    result.transport_error = "curl init failed";
    return result;
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& h : headers) header_list = curl_slist_append(header_list, h.c_str());

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
  if (post_body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);

  const CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    result.status = 0;
    result.transport_error = std::string("curl error: ") + curl_easy_strerror(res);
  }
  return result;
}

bool HttpIngestClient::health() {
  const HttpResult r = perform(options_.api_url + "/health", nullptr, {});
  return r.transport_error.empty() && r.status == 200;
}

BatchResponse HttpIngestClient::submit_batch(const std::vector<EventEnvelope>& events,
                                             const std::string& bearer_token) {
  std::vector<std::string> ids;
  ids.reserve(events.size());
  for (const auto& e : events) ids.push_back(e.event_id);

  const std::string body = batch_request_body(events);
  const HttpResult r = perform(options_.api_url + "/api/v1/events/batch/", &body,
                               {"Authorization: Bearer " + bearer_token,
                                "Content-Type: application/json",
                                "Idempotency-Key: " + batch_idempotency_key(ids)});
  BatchResponse out = classify_batch_response(r.status, r.body, r.transport_error);
  if (out.outcome != BatchOutcome::ok) {
    log_event(LogLevel::info, "ingest", "batch not accepted",
              {{"outcome", to_string(out.outcome)}, {"error", out.error},
               {"events", std::to_string(events.size())}});
  }
  return out;
}

JoinResponse HttpIngestClient::join_mission(const std::string& mission_id,
                                            const std::string& role,
                                            const std::string& bearer_token) {
  jsonlite::Object req;
  req["role"] = jsonlite::Value{role};
  const std::string body = jsonlite::to_json(req);
  const HttpResult r = perform(options_.api_url + "/api/v1/missions/" + mission_id + "/participants",
                               &body,
                               {"Authorization: Bearer " + bearer_token,
                                "Content-Type: application/json"});
  return parse_join_response(r.status, r.body, r.transport_error);
}

}  // namespace concord
