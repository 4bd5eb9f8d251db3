#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "concord/collision.hpp"
#include "concord/config.hpp"
#include "concord/event.hpp"
#include "concord/file_io.hpp"
#include "concord/hash.hpp"
#include "concord/ingest_client.hpp"
#include "concord/jsonlite.hpp"
#include "concord/lamport.hpp"
#include "concord/node.hpp"
#include "concord/observability.hpp"
#include "concord/queue_store.hpp"
#include "concord/replay.hpp"
#include "concord/roster.hpp"
#include "concord/service.hpp"
#include "concord/session.hpp"
#include "concord/types.hpp"
#include "concord/ulid.hpp"
#include "concord/version.hpp"

using namespace concord;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Log records captured instead of written to stderr.
std::vector<LogRecord> g_logs;
void capture_log(const LogRecord& r) { g_logs.push_back(r); }

bool logged(const std::string& component, const std::string& fragment) {
  for (const auto& r : g_logs) {
    if (r.component == component && r.message.find(fragment) != std::string::npos) return true;
  }
  return false;
}

struct TempHome {
  fs::path path;
  explicit TempHome(const std::string& name) {
    path = fs::temp_directory_path() /
           ("concord_" + name + "_" + std::to_string(static_cast<long>(::getpid())));
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempHome() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

std::string slurp(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void spit(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

unsigned file_mode(const fs::path& p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) return 0;
  return static_cast<unsigned>(st.st_mode & 0777);
}

const std::string kMission = "M-042";

// Build a valid envelope stamped by `clock`.
EventEnvelope stamp(LamportClock& clock, EventType type, EventPayload payload,
                    const std::string& timestamp = "",
                    std::optional<std::string> causation = std::nullopt) {
  EnvelopeMeta meta;
  meta.event_id = generate_id();
  meta.origin_node = clock.node_id();
  meta.logical_clock = clock.increment().value_or(0);
  meta.timestamp = timestamp;
  meta.causation_id = std::move(causation);
  OpError err;
  auto env = make_envelope(type, std::move(payload), meta, &err);
  expect(env.has_value(), "fixture envelope must be valid: " + err.message);
  return *env;
}

EventEnvelope joined(LamportClock& clock, const std::string& pid, const std::string& ts = "") {
  return stamp(clock, EventType::participant_joined,
               ParticipantJoinedPayload{pid, kMission, "developer", std::nullopt}, ts);
}

EventEnvelope focused(LamportClock& clock, const std::string& pid, const std::string& focus,
                      const std::string& ts = "") {
  return stamp(clock, EventType::focus_changed,
               FocusChangedPayload{pid, kMission, parse_focus(focus), std::nullopt}, ts);
}

EventEnvelope driving(LamportClock& clock, const std::string& pid, DriveIntent intent,
                      const std::string& ts = "") {
  return stamp(clock, EventType::drive_intent_set, DriveIntentSetPayload{pid, kMission, intent}, ts);
}

// ---------------------------------------------------------------------------
// Scripted ingestion service.
// ---------------------------------------------------------------------------
class FakeIngestClient : public IIngestClient {
 public:
  bool online{true};
  std::vector<BatchResponse> scripted;                 // consumed front-first
  std::map<std::string, EventVerdict> verdicts;        // overrides for the default reply
  std::vector<std::vector<std::string>> batches;       // event ids per submit
  std::string last_token;
  int join_calls{0};
  JoinResponse join_response;

  bool health() override { return online; }

  BatchResponse submit_batch(const std::vector<EventEnvelope>& events,
                             const std::string& bearer_token) override {
    last_token = bearer_token;
    std::vector<std::string> ids;
    for (const auto& e : events) ids.push_back(e.event_id);
    batches.push_back(ids);

    if (!scripted.empty()) {
      BatchResponse r = scripted.front();
      scripted.erase(scripted.begin());
      return r;
    }
    if (!online) return classify_batch_response(0, "", "connection refused");

    BatchResponse r;
    r.outcome = BatchOutcome::ok;
    r.http_status = 200;
    for (const auto& id : ids) {
      auto it = verdicts.find(id);
      r.verdicts[id] = it != verdicts.end() ? it->second : EventVerdict{VerdictStatus::accepted, ""};
    }
    return r;
  }

  JoinResponse join_mission(const std::string&, const std::string&, const std::string&) override {
    ++join_calls;
    return join_response;
  }

  size_t events_sent() const {
    size_t n = 0;
    for (const auto& b : batches) n += b.size();
    return n;
  }
};

BatchResponse transient_response() { return classify_batch_response(0, "", "timeout"); }

// ============================================================================
// Phase 1: Primitives (hashing, JSON, time)
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_hash_domain_separation() {
  const std::string payload = "01J0000000000000000000000A";
  expect(envelope_digest(payload) != batch_idempotency_key({payload}),
         "evt: and batch: domains must never collide");
  expect(is_hex_digest(envelope_digest(payload)), "digest is 64 lowercase hex");
  expect(!is_hex_digest("ABCD"), "short digest rejected");

  const std::vector<std::string> ids{"A", "B"};
  expect(batch_idempotency_key(ids) == batch_idempotency_key(ids), "idempotency key is stable");
  expect(batch_idempotency_key(ids) != batch_idempotency_key({"B", "A"}),
         "idempotency key depends on submission order");
}

void test_jsonlite_strictness() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"b\":1,\"a\":\"x\\u00e9\\n\"}", &err);
  expect(!err, "valid object parses");
  expect(jsonlite::get_string(obj, "a") == "x\xc3\xa9\n", "\\u escape decodes to UTF-8");
  expect(jsonlite::to_json(obj) == "{\"a\":\"x\xc3\xa9\\n\",\"b\":1}", "keys serialise sorted");

  err.reset();
  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  jsonlite::parse("{\"event_id\":\"01J", &err);
  expect(err.has_value(), "truncated document rejected");

  err.reset();
  jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "non-object rejected by parse()");

  expect(jsonlite::escape(std::string("a\x01") + "b") == "a\\u0001b", "control chars escaped");
}

void test_iso8601_roundtrip() {
  const uint64_t ms = 1760862930250ull;
  const std::string s = format_iso8601(ms);
  expect(s.size() == 24 && s.back() == 'Z', "format is YYYY-MM-DDTHH:MM:SS.mmmZ");
  expect(parse_iso8601(s) == ms, "format/parse round-trip");
  expect(parse_iso8601("2025-10-19T08:15:30+00:00").has_value(), "+00:00 accepted");
  expect(!parse_iso8601("2025-10-19 08:15:30").has_value(), "space separator rejected");
  expect(!parse_iso8601("2025-10-19T08:15:30+02:00").has_value(), "non-UTC offset rejected");
}

// ============================================================================
// Phase 2: Identifier generator
// ============================================================================

void test_ulid_unique_and_sorted() {
  std::vector<std::string> ids;
  ids.reserve(10000);
  for (int i = 0; i < 10000; ++i) ids.push_back(generate_id());
  std::set<std::string> unique(ids.begin(), ids.end());
  expect(unique.size() == ids.size(), "10,000 ids contain no duplicates");
  for (size_t i = 1; i < ids.size(); ++i) {
    expect(ids[i - 1] < ids[i], "ids sort in generation order");
  }
  for (const auto& id : ids) expect(is_valid_id(id), "generated id is valid");
}

void test_ulid_same_millisecond_monotonic() {
  uint64_t now = 1700000000000ull;
  UlidGenerator gen([&now] { return now; });
  const std::string a = gen.next();
  const std::string b = gen.next();
  expect(a < b, "same-millisecond ids strictly increase");
  expect(a.substr(0, 10) == b.substr(0, 10), "same-millisecond ids share the time prefix");
  expect(id_timestamp_ms(a) == now, "timestamp decodes");

  now -= 5000;  // wall clock steps backwards
  const std::string c = gen.next();
  expect(b < c, "clock regression never breaks ordering");
}

void test_ulid_validation() {
  expect(is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAV"), "canonical example accepted");
  expect(is_valid_id("01arz3ndektsv4rrffq69g5fav"), "lowercase accepted");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FA"), "25 chars rejected");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAVX"), "27 chars rejected");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAI"), "I rejected");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAL"), "L rejected");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAO"), "O rejected");
  expect(!is_valid_id("01ARZ3NDEKTSV4RRFFQ69G5FAU"), "U rejected");
  expect(!is_valid_id("81ARZ3NDEKTSV4RRFFQ69G5FAV"), "timestamp overflow rejected");
}

// ============================================================================
// Phase 3: Lamport clock
// ============================================================================

void test_lamport_persists_across_instances() {
  TempHome home("lamport_persist");
  const fs::path file = LamportClock::default_path(home.path);
  {
    LamportClock clock("node-a", file);
    expect(clock.current() == 0, "fresh clock starts at zero");
    expect(clock.increment() == 1u, "first increment");
    expect(clock.increment() == 2u, "second increment");
  }
  LamportClock reopened("node-a", file);
  expect(reopened.current() == 2, "counter survives restart");
  expect(reopened.observe(10) == 11u, "observe = max(local, remote) + 1");
  expect(reopened.observe(3) == 12u, "observe of an older stamp still advances");
}

void test_lamport_nodes_do_not_cross_contaminate() {
  TempHome home("lamport_nodes");
  const fs::path file = LamportClock::default_path(home.path);
  LamportClock a("node-a", file);
  LamportClock b("node-b", file);
  expect(a.increment() == 1u, "a:1");
  expect(a.increment() == 2u, "a:2");
  expect(b.increment() == 1u, "b starts independently");
  expect(a.increment() == 3u, "a unaffected by b");

  const auto counters = a.snapshot();
  expect(counters.at("node-a") == 3 && counters.at("node-b") == 1, "both keys preserved");
}

void test_lamport_shared_node_id_never_repeats() {
  TempHome home("lamport_shared");
  const fs::path file = LamportClock::default_path(home.path);
  LamportClock first("node-a", file);
  LamportClock second("node-a", file);  // second process, same node
  std::set<uint64_t> seen;
  for (int i = 0; i < 20; ++i) {
    LamportClock& c = (i % 2 == 0) ? first : second;
    const auto v = c.increment();
    expect(v.has_value(), "increment persisted");
    expect(seen.insert(*v).second, "no value handed out twice for one node");
  }
  expect(first.current() == 20, "counter reflects every increment");
}

void test_lamport_corrupt_file_resets() {
  TempHome home("lamport_corrupt");
  const fs::path file = LamportClock::default_path(home.path);
  spit(file, "{\"node-a\": 7,");
  g_logs.clear();
  LamportClock clock("node-a", file);
  expect(clock.current() == 0, "corrupt file treated as zero");
  expect(clock.increment() == 1u, "clock restarts from zero");
  expect(logged("clock", "corrupt"), "corruption logged");
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(slurp(file), &err);
  expect(!err, "file rewritten as valid JSON");
}

// ============================================================================
// Phase 4: Event model
// ============================================================================

void test_envelope_validation() {
  EnvelopeMeta meta;
  meta.event_id = generate_id();
  meta.origin_node = "node-a";
  meta.logical_clock = 1;
  OpError err;

  auto env = make_envelope(EventType::drive_intent_set,
                           DriveIntentSetPayload{"", kMission, DriveIntent::active}, meta, &err);
  expect(!env && err.code == ErrorCode::invalid_input, "empty participant_id rejected");

  err = {};
  env = make_envelope(EventType::focus_changed,
                      DriveIntentSetPayload{"p1", kMission, DriveIntent::active}, meta, &err);
  expect(!env && err.code == ErrorCode::invalid_input, "payload shape must match type");

  err = {};
  CollisionPayload c{"p1", kMission, generate_id(), {"p1", "p2"}, parse_focus("wp:WP01"),
                     Severity::medium};
  env = make_envelope(EventType::concurrent_driver_warning, c, meta, &err);
  expect(!env, "ConcurrentDriverWarning requires high severity");

  err = {};
  meta.causation_id = "not-an-id";
  env = make_envelope(EventType::drive_intent_set,
                      DriveIntentSetPayload{"p1", kMission, DriveIntent::active}, meta, &err);
  expect(!env, "malformed causation_id rejected");

  meta.causation_id.reset();
  env = make_envelope(EventType::drive_intent_set,
                      DriveIntentSetPayload{"p1", kMission, DriveIntent::active}, meta, &err);
  expect(env.has_value(), "valid envelope builds");
  expect(env->aggregate_id == "mission/" + kMission, "aggregate derived from mission");
  expect(parse_iso8601(env->timestamp).has_value(), "timestamp defaulted to now");
}

void test_focus_formats() {
  const auto wp = parse_focus("wp:WP01");
  expect(wp && wp->kind == FocusTarget::Kind::work_package && wp->id == "WP01", "wp parse");
  const auto step = parse_focus("step:plan-3");
  expect(step && step->kind == FocusTarget::Kind::step, "step parse");
  expect(!parse_focus("wp:"), "empty id rejected");
  expect(!parse_focus("task:1"), "unknown prefix rejected");
  expect(format_focus(*wp) == "wp:WP01", "format round-trip");

  expect(jsonlite::to_json(focus_to_wire(wp)) ==
             "{\"target_id\":\"WP01\",\"target_type\":\"work_package\"}",
         "wire shape");
  std::optional<FocusTarget> back;
  expect(focus_from_wire(focus_to_wire(wp), &back) && back == wp, "wire parse");
  expect(focus_from_wire(jsonlite::Value{nullptr}, &back) && !back, "null means no focus");
}

void test_comment_truncation_helpers() {
  std::string text(600, 'x');
  expect(truncate_utf8(text, kMaxCommentLength).size() == 500, "ascii truncated to 500");
  std::string accents;
  for (int i = 0; i < 501; ++i) accents += "\xc3\xa9";
  const std::string cut = truncate_utf8(accents, kMaxCommentLength);
  expect(utf8_length(cut) == 500 && cut.size() == 1000, "truncation respects code points");
}

// ============================================================================
// Phase 5: Event queue store
// ============================================================================

void test_queue_append_order_and_clock() {
  TempHome home("queue_order");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();

  std::vector<std::string> appended;
  auto e1 = joined(clock, p1);
  auto e2 = focused(clock, p1, "wp:WP01");
  auto e3 = driving(clock, p1, DriveIntent::active);
  for (const auto* e : {&e1, &e2, &e3}) {
    expect(!queue.append(kMission, *e), "append succeeds");
    appended.push_back(e->event_id);
  }

  const auto all = queue.read_all(kMission);
  expect(all.size() == 3, "three entries");
  for (size_t i = 0; i < all.size(); ++i) {
    expect(all[i].event.event_id == appended[i], "append order preserved");
    if (i > 0) {
      expect(all[i].event.logical_clock > all[i - 1].event.logical_clock,
             "logical clock strictly increasing per node");
    }
  }
  expect(file_mode(queue.queue_path(kMission)) == 0600, "queue file is owner-only");
}

void test_queue_entry_roundtrip_all_statuses() {
  TempHome home("queue_roundtrip");
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();

  QueueEntry entry;
  entry.event = stamp(clock, EventType::comment_posted,
                      CommentPostedPayload{p1, kMission, generate_id(), "ship it \xe2\x9c\x93",
                                           std::nullopt, {"p2"}});
  for (ReplayStatus status : {ReplayStatus::pending, ReplayStatus::delivered, ReplayStatus::failed}) {
    entry.replay_status = status;
    entry.retry_count = status == ReplayStatus::failed ? 2 : 0;
    entry.last_retry_at = status == ReplayStatus::pending ? std::nullopt
                                                          : std::optional<std::string>("2025-10-19T08:00:00.000Z");
    std::string err;
    const auto back = parse_entry_line(entry_to_line(entry), &err);
    expect(back.has_value(), "line parses: " + err);
    expect(entry_to_line(*back) == entry_to_line(entry), "structurally identical after round-trip");
    expect(back->replay_status == status && back->retry_count == entry.retry_count &&
               back->last_retry_at == entry.last_retry_at,
           "replay metadata preserved");
  }
}

void test_queue_skips_corrupt_and_truncated_lines() {
  TempHome home("queue_corrupt");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();

  expect(!queue.append(kMission, joined(clock, p1)), "first append");
  {
    std::ofstream ofs(queue.queue_path(kMission), std::ios::app | std::ios::binary);
    ofs << "this is not json\n";
    ofs << "{\"event_id\":\"01J";  // crash mid-append
  }
  g_logs.clear();
  const uint64_t skipped_before = global_sync_stats().corrupt_lines_skipped.load();
  expect(queue.read_all(kMission).size() == 1, "corrupt and truncated lines skipped");
  expect(global_sync_stats().corrupt_lines_skipped.load() == skipped_before + 2, "both counted");
  expect(logged("queue", "corrupt") && logged("queue", "truncated"), "warnings logged");

  // The next append must not be glued onto the truncated fragment.
  expect(!queue.append(kMission, focused(clock, p1, "wp:WP01")), "append after crash");
  const auto all = queue.read_all(kMission);
  expect(all.size() == 2, "new entry readable after truncated line");
  expect(std::holds_alternative<FocusChangedPayload>(all[1].event.payload), "new entry intact");
}

void test_queue_rejects_digest_mismatch() {
  TempHome home("queue_digest");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();
  expect(!queue.append(kMission, joined(clock, p1)), "append");
  expect(!queue.append(kMission, driving(clock, p1, DriveIntent::active)), "append");

  std::string content = slurp(queue.queue_path(kMission));
  const auto pos = content.find("\"intent\":\"active\"");
  expect(pos != std::string::npos, "fixture contains intent");
  content.replace(pos, 17, "\"intent\":\"inactive\"");
  spit(queue.queue_path(kMission), content);

  const auto all = queue.read_all(kMission);
  expect(all.size() == 1, "tampered entry skipped");
  expect(all[0].event.event_type == EventType::participant_joined, "untouched entry kept");
}

void test_queue_ignores_foreign_aggregate() {
  TempHome home("queue_foreign");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();

  auto foreign = stamp(clock, EventType::participant_joined,
                       ParticipantJoinedPayload{p1, "OTHER", "developer", std::nullopt});
  const OpError err = queue.append(kMission, foreign);
  expect(err.code == ErrorCode::invalid_input, "append refuses another stream's envelope");

  // A foreign line that got into the file anyway is filtered on read.
  QueueEntry e;
  e.event = foreign;
  spit(queue.queue_path(kMission), entry_to_line(e) + "\n");
  expect(queue.read_all(kMission).empty(), "foreign aggregate filtered");

  expect(queue.append("../escape", joined(clock, p1)).code == ErrorCode::invalid_input,
         "path-like stream id rejected");
}

void test_queue_stamped_append_serializes_shared_node() {
  TempHome home("queue_stamped");
  EventQueueStore queue(home.path);
  const fs::path clock_file = LamportClock::default_path(home.path);
  const std::string p1 = generate_id();
  constexpr size_t kPerWriter = 25;

  // Two CLI processes on one node: separate clock instances, same file.
  const auto writer = [&]() {
    LamportClock clock("node-a", clock_file);
    for (size_t i = 0; i < kPerWriter; ++i) {
      OpError err;
      const auto env = queue.append_stamped(
          kMission,
          [&](OpError*) -> std::optional<EventEnvelope> { return focused(clock, p1, "wp:WP01"); },
          &err);
      expect(env.has_value(), "stamped append succeeds: " + err.message);
    }
  };
  std::thread a(writer);
  std::thread b(writer);
  a.join();
  b.join();

  const auto all = queue.read_all(kMission);
  expect(all.size() == 2 * kPerWriter, "every append landed");
  for (size_t i = 1; i < all.size(); ++i) {
    expect(all[i].event.logical_clock > all[i - 1].event.logical_clock,
           "append order follows the shared clock");
  }

  LamportClock clock("node-a", clock_file);
  const uint64_t before = clock.current();
  OpError err;
  bool stamped = false;
  const auto refused = queue.append_stamped(
      "../escape",
      [&](OpError*) -> std::optional<EventEnvelope> {
        stamped = true;
        return joined(clock, p1);
      },
      &err);
  expect(!refused && err.code == ErrorCode::invalid_input, "bad stream id refused");
  expect(!stamped && clock.current() == before, "clock untouched when nothing is appended");
}

void test_queue_update_status_and_requeue() {
  TempHome home("queue_update");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();
  auto e1 = joined(clock, p1);
  auto e2 = focused(clock, p1, "wp:WP01");
  auto e3 = driving(clock, p1, DriveIntent::active);
  for (const auto* e : {&e1, &e2, &e3}) expect(!queue.append(kMission, *e), "append");

  std::map<std::string, StatusUpdate> updates;
  updates[e1.event_id] = StatusUpdate{ReplayStatus::delivered, 0, std::nullopt};
  updates[e2.event_id] = StatusUpdate{ReplayStatus::failed, 1, std::string("2025-10-19T08:00:00.000Z")};
  updates["01ARZ3NDEKTSV4RRFFQ69G5FAV"] = StatusUpdate{ReplayStatus::delivered, 0, std::nullopt};
  expect(!queue.update_status(kMission, updates), "update_status succeeds");

  const auto pending = queue.read_pending(kMission);
  expect(pending.size() == 1 && pending[0].event.event_id == e3.event_id,
         "delivered and failed entries leave the pending set");
  expect(queue.read_all(kMission).size() == 3, "entries are never deleted");

  const auto summary = queue.summary(kMission);
  expect(summary.delivered == 1 && summary.failed == 1 && summary.pending == 1, "summary counts");
  expect(summary.failed_event_ids == std::vector<std::string>{e2.event_id}, "failed ids listed");

  OpError err;
  expect(queue.requeue_failed(kMission, &err) == 1u, "one entry requeued");
  const auto again = queue.find(kMission, e2.event_id);
  expect(again && again->replay_status == ReplayStatus::pending, "failed entry pending again");
  expect(again->retry_count == 1, "retry_count kept on requeue");
  expect(file_mode(queue.queue_path(kMission)) == 0600, "rewrite keeps owner-only mode");
}

// ============================================================================
// Phase 6: Replay transport
// ============================================================================

struct ReplayFixture {
  TempHome home;
  EventQueueStore queue;
  LamportClock clock;
  FakeIngestClient client;
  std::vector<std::chrono::milliseconds> sleeps;
  ReplayTransport transport;

  explicit ReplayFixture(const std::string& name, RetryPolicy policy = RetryPolicy{})
      : home(name),
        queue(home.path),
        clock("node-a", LamportClock::default_path(home.path)),
        transport(queue, client, policy,
                  [this](std::chrono::milliseconds d) { sleeps.push_back(d); }) {}

  std::vector<std::string> seed(size_t n) {
    std::vector<std::string> ids;
    const std::string p = generate_id();
    for (size_t i = 0; i < n; ++i) {
      auto e = i == 0 ? joined(clock, p) : driving(clock, p, i % 2 ? DriveIntent::active
                                                                   : DriveIntent::inactive);
      expect(!queue.append(kMission, e), "seed append");
      ids.push_back(e.event_id);
    }
    return ids;
  }

  ReplayStatus status_of(const std::string& id) const {
    const auto e = queue.find(kMission, id);
    expect(e.has_value(), "entry exists");
    return e->replay_status;
  }
};

void test_replay_duplicate_and_rejected_verdicts() {
  ReplayFixture f("replay_verdicts");
  const auto ids = f.seed(2);
  f.client.verdicts[ids[0]] = EventVerdict{VerdictStatus::duplicate, ""};
  f.client.verdicts[ids[1]] = EventVerdict{VerdictStatus::rejected, "participant not in mission roster"};

  const auto report = f.transport.replay(kMission, "tok");
  expect(!report.error, "replay persisted verdicts");
  expect(report.accepted == std::vector<std::string>{ids[0]}, "duplicate counts as accepted");
  expect(report.rejected == std::vector<std::string>{ids[1]}, "rejection reported");
  expect(f.status_of(ids[0]) == ReplayStatus::delivered, "duplicate → delivered");
  const auto failed = f.queue.find(kMission, ids[1]);
  expect(failed->replay_status == ReplayStatus::failed, "rejected → failed");
  expect(failed->retry_count == 0, "rejection does not bump retry_count");
  expect(f.client.last_token == "tok", "bearer token forwarded");
}

void test_replay_timeout_leaves_pending_then_retries() {
  ReplayFixture f("replay_timeout", RetryPolicy{3, 1000, 30000});
  const auto ids = f.seed(3);
  f.client.scripted = {transient_response(), transient_response(), transient_response()};

  const auto report = f.transport.replay(kMission, "tok");
  expect(report.attempts == 3, "batch attempted max_attempts times");
  expect(f.sleeps.size() == 2 && f.sleeps[0].count() == 1000 && f.sleeps[1].count() == 2000,
         "exponential backoff 1s, 2s through the injected sleeper");
  expect(report.deferred.size() == 3 && report.accepted.empty() && report.rejected.empty(),
         "exhausted batch is deferred, never rejected");
  for (const auto& id : ids) {
    const auto e = f.queue.find(kMission, id);
    expect(e->replay_status == ReplayStatus::pending, "timeout leaves entry pending");
    expect(e->retry_count == 1 && e->last_retry_at.has_value(), "retry metadata stamped");
  }

  const auto second = f.transport.replay(kMission, "tok");
  expect(second.accepted.size() == 3, "next replay retries and delivers");
  expect(f.queue.read_pending(kMission).empty(), "nothing pending afterwards");
}

void test_replay_transient_then_success() {
  ReplayFixture f("replay_recover", RetryPolicy::zero_delay(3));
  const auto ids = f.seed(2);
  BatchResponse ok;
  ok.outcome = BatchOutcome::ok;
  ok.http_status = 200;
  for (const auto& id : ids) ok.verdicts[id] = EventVerdict{VerdictStatus::accepted, ""};
  f.client.scripted = {classify_batch_response(503, "", ""), ok};

  const auto report = f.transport.replay(kMission, "tok");
  expect(report.attempts == 2 && report.accepted.size() == 2, "second attempt succeeds");
  expect(f.client.batches[0] == f.client.batches[1], "retry resends the identical batch");
  for (const auto& id : ids) {
    expect(f.queue.find(kMission, id)->retry_count == 0, "successful retry leaves retry_count");
  }
}

void test_replay_delivered_is_noop() {
  ReplayFixture f("replay_noop", RetryPolicy::zero_delay());
  f.seed(3);
  f.transport.replay(kMission, "tok");
  const size_t sent = f.client.events_sent();
  const auto again = f.transport.replay(kMission, "tok");
  expect(f.client.events_sent() == sent, "delivered entries are never resent");
  expect(again.batches == 0 && again.accepted.empty(), "empty replay");
}

void test_replay_batches_of_at_most_max() {
  ReplayFixture f("replay_batches", RetryPolicy::zero_delay());
  f.seed(250);
  const auto report = f.transport.replay(kMission, "tok");
  expect(report.batches == 3, "250 entries → 3 batches");
  expect(f.client.batches[0].size() == 100 && f.client.batches[1].size() == 100 &&
             f.client.batches[2].size() == 50,
         "batches capped at 100");
  expect(report.accepted.size() == 250, "all accepted");

  ReplayFixture g("replay_batches_small", RetryPolicy::zero_delay());
  g.seed(5);
  expect(g.transport.replay(kMission, "tok", 2).batches == 3, "custom batch size honoured");
}

void test_replay_missing_verdict_stays_pending() {
  ReplayFixture f("replay_missing", RetryPolicy::zero_delay());
  const auto ids = f.seed(2);
  BatchResponse partial;
  partial.outcome = BatchOutcome::ok;
  partial.http_status = 200;
  partial.verdicts[ids[0]] = EventVerdict{VerdictStatus::accepted, ""};
  f.client.scripted = {partial};

  const auto report = f.transport.replay(kMission, "tok");
  expect(f.status_of(ids[0]) == ReplayStatus::delivered, "verdict applied");
  expect(f.status_of(ids[1]) == ReplayStatus::pending, "no verdict → still pending");
  expect(f.queue.find(kMission, ids[1])->retry_count == 0, "no verdict is not a failed attempt");
  expect(report.deferred == std::vector<std::string>{ids[1]}, "reported as deferred");
}

void test_replay_batch_level_outcomes() {
  ReplayFixture f("replay_batch_reject", RetryPolicy::zero_delay());
  const auto ids = f.seed(2);
  f.client.scripted = {classify_batch_response(400, "{\"detail\":\"bad batch\"}", "")};
  const auto report = f.transport.replay(kMission, "tok");
  expect(report.attempts == 1, "4xx is not retried");
  for (const auto& id : ids) expect(f.status_of(id) == ReplayStatus::failed, "4xx → failed");

  ReplayFixture g("replay_unauthorized", RetryPolicy::zero_delay());
  const auto gids = g.seed(2);
  g.client.scripted = {classify_batch_response(401, "", "")};
  const auto r2 = g.transport.replay(kMission, "tok");
  expect(r2.attempts == 1, "401 is not retried");
  for (const auto& id : gids) {
    expect(g.status_of(id) == ReplayStatus::pending, "401 leaves events pending");
  }
}

void test_batch_response_classification() {
  auto r = classify_batch_response(200, "{\"accepted\":[\"A\"],\"rejected\":[\"B\"]}", "");
  expect(r.outcome == BatchOutcome::ok, "legacy shape ok");
  expect(r.verdicts.at("A").status == VerdictStatus::accepted &&
             r.verdicts.at("B").status == VerdictStatus::rejected,
         "legacy verdicts");

  r = classify_batch_response(
      207, "{\"results\":[{\"event_id\":\"A\",\"status\":\"duplicate\"},"
           "{\"event_id\":\"B\",\"status\":\"rejected\",\"reason\":\"participant not in mission roster\"}]}",
      "");
  expect(r.outcome == BatchOutcome::ok && r.verdicts.at("A").status == VerdictStatus::duplicate,
         "results shape");
  expect(r.verdicts.at("B").reason == "participant not in mission roster", "reason kept");

  r = classify_batch_response(422, "{\"results\":[{\"event_id\":\"A\",\"status\":\"rejected\"}]}", "");
  expect(r.outcome == BatchOutcome::ok, "4xx with per-event verdicts is a partial verdict");

  expect(classify_batch_response(429, "", "").outcome == BatchOutcome::transient, "429 transient");
  expect(classify_batch_response(408, "", "").outcome == BatchOutcome::transient, "408 transient");
  expect(classify_batch_response(502, "", "").outcome == BatchOutcome::transient, "5xx transient");
  expect(classify_batch_response(200, "<html>", "").outcome == BatchOutcome::transient,
         "unparseable 2xx transient");
  expect(classify_batch_response(0, "", "curl error: timeout").outcome == BatchOutcome::transient,
         "transport error transient");
  expect(classify_batch_response(403, "", "").outcome == BatchOutcome::unauthorized, "403");
}

void test_retry_policy_schedule() {
  RetryPolicy p{5, 1000, 5000};
  expect(p.delay_for(0).count() == 1000 && p.delay_for(1).count() == 2000 &&
             p.delay_for(2).count() == 4000,
         "1s, 2s, 4s");
  expect(p.delay_for(3).count() == 5000 && p.delay_for(30).count() == 5000, "capped");
  expect(RetryPolicy::zero_delay().delay_for(2).count() == 0, "zero-delay policy");
}

void test_deliver_now_single_attempt() {
  ReplayFixture f("deliver_now", RetryPolicy::zero_delay(3));
  const auto ids = f.seed(1);
  const auto env = f.queue.find(kMission, ids[0])->event;

  f.client.online = false;
  auto d = f.transport.deliver_now(kMission, env, "tok");
  expect(d.state == DeliveryState::queued && f.client.batches.empty(),
         "offline: no submit, stays queued");

  f.client.online = true;
  f.client.scripted = {transient_response()};
  d = f.transport.deliver_now(kMission, env, "tok");
  expect(d.state == DeliveryState::queued && f.client.batches.size() == 1, "one attempt only");
  expect(f.queue.find(kMission, ids[0])->retry_count == 0, "metadata untouched on failure");

  d = f.transport.deliver_now(kMission, env, "tok");
  expect(d.state == DeliveryState::delivered, "delivered");
  expect(f.status_of(ids[0]) == ReplayStatus::delivered, "status persisted");
}

// ============================================================================
// Phase 7: Roster view + collision detection
// ============================================================================

void test_roster_fold_rules() {
  TempHome home("roster_fold");
  EventQueueStore queue(home.path);
  LamportClock clock("node-a", LamportClock::default_path(home.path));
  const std::string p1 = generate_id();
  const std::string stranger = generate_id();

  expect(!queue.append(kMission, joined(clock, p1, "2025-10-19T08:00:00.000Z")), "join");
  expect(!queue.append(kMission, joined(clock, p1, "2025-10-19T08:00:01.000Z")), "duplicate join");
  expect(!queue.append(kMission, focused(clock, p1, "wp:WP01", "2025-10-19T08:00:02.000Z")), "focus");
  expect(!queue.append(kMission, driving(clock, p1, DriveIntent::active, "2025-10-19T08:00:03.000Z")),
         "drive");
  const Roster before_stranger = build_roster(queue, kMission);
  expect(!queue.append(kMission, driving(clock, stranger, DriveIntent::active)), "stranger");

  const Roster roster = build_roster(queue, kMission);
  expect(roster.size() == 1, "unknown participant never materialises");
  expect(roster == before_stranger, "event for unknown participant leaves roster unchanged");
  const auto& s = roster.at(p1);
  expect(s.joined_at == "2025-10-19T08:00:00.000Z", "duplicate join ignored");
  expect(s.focus == parse_focus("wp:WP01"), "focus folded");
  expect(s.drive_intent == DriveIntent::active, "drive folded");
  expect(s.last_activity_at == "2025-10-19T08:00:03.000Z", "last_activity_at = last event time");

  expect(build_roster(queue, kMission) == roster, "rebuild with no new events is identical");
}

struct CollisionFixture {
  TempHome home;
  EventQueueStore queue;
  LamportClock clock;
  std::vector<EventEnvelope> emitted;
  CollisionDetector detector;

  explicit CollisionFixture(const std::string& name)
      : home(name),
        queue(home.path),
        clock("node-a", LamportClock::default_path(home.path)),
        detector(queue, [this](EventType type, EventPayload payload, const std::string& id) {
          EnvelopeMeta meta;
          meta.event_id = id;
          meta.origin_node = clock.node_id();
          meta.logical_clock = clock.increment().value_or(0);
          OpError err;
          auto env = make_envelope(type, std::move(payload), meta, &err);
          if (!env) return err;
          emitted.push_back(*env);
          return queue.append(kMission, *env);
        }) {}

  void driver(const std::string& pid, const std::string& focus) {
    expect(!queue.append(kMission, joined(clock, pid)), "join");
    expect(!queue.append(kMission, focused(clock, pid, focus)), "focus");
    expect(!queue.append(kMission, driving(clock, pid, DriveIntent::active)), "drive");
  }
};

void test_collision_severity_levels() {
  CollisionFixture f("collision_levels");
  const std::string me = generate_id();
  expect(!f.queue.append(kMission, joined(f.clock, me)), "requester joined");
  const auto focus = parse_focus("wp:WP01");

  auto r = f.detector.detect(kMission, me, focus);
  expect(!r.warning && !r.error && f.emitted.empty(), "zero other drivers → none");

  const std::string p1 = generate_id();
  f.driver(p1, "wp:WP01");
  f.driver(generate_id(), "wp:WP02");  // other target: irrelevant
  r = f.detector.detect(kMission, me, focus);
  expect(r.warning && r.warning->severity == Severity::medium, "one other driver → medium");
  expect(r.warning->kind == EventType::potential_step_collision_detected, "medium kind");
  expect(r.warning->conflicting_participants.size() == 1 &&
             r.warning->conflicting_participants[0].participant_id == p1,
         "conflict lists p1");

  const auto stored = f.queue.find(kMission, r.warning->warning_id);
  expect(stored.has_value(), "warning event appended before detect() returned");
  const auto& payload = std::get<CollisionPayload>(stored->event.payload);
  expect(payload.participant_ids == std::vector<std::string>{me, p1}, "requester listed first");

  f.driver(generate_id(), "wp:WP01");
  r = f.detector.detect(kMission, me, focus);
  expect(r.warning && r.warning->severity == Severity::high, "two other drivers → high");
  expect(r.warning->kind == EventType::concurrent_driver_warning, "high kind");

  r = f.detector.detect(kMission, me, std::nullopt);
  expect(!r.warning, "requester without focus never collides");
}

void test_collision_ignores_inactive_and_unknown() {
  CollisionFixture f("collision_unknown");
  const std::string p1 = generate_id();
  f.driver(p1, "wp:WP01");

  // p2 has not joined: invisible, no false collision.
  const auto r = f.detector.detect(kMission, generate_id(), parse_focus("wp:WP01"));
  expect(!r.warning && f.emitted.empty(), "unknown requester gets no warning");

  const std::string me = generate_id();
  expect(!f.queue.append(kMission, joined(f.clock, me)), "join");
  expect(!f.queue.append(kMission, driving(f.clock, p1, DriveIntent::inactive)), "p1 releases");
  expect(!f.detector.detect(kMission, me, parse_focus("wp:WP01")).warning,
         "inactive participant is not a driver");
}

// ============================================================================
// Phase 8: Session cache
// ============================================================================

SessionState sample_session(const std::string& mission) {
  SessionState s;
  s.mission_id = mission;
  s.mission_run_id = "run-1";
  s.participant_id = generate_id();
  s.role = "developer";
  s.joined_at = "2025-10-19T08:00:00.000Z";
  s.last_activity_at = "2025-10-19T08:05:00.000Z";
  s.focus = parse_focus("step:plan");
  s.session_token = "secret";
  s.api_url = "http://svc";
  return s;
}

void test_session_store_roundtrip() {
  TempHome home("session_roundtrip");
  SessionStore store(home.path.string());
  const SessionState s = sample_session(kMission);
  expect(!store.save(kMission, s), "save");
  expect(file_mode(store.session_path(kMission)) == 0600, "session file is owner-only");

  const auto back = store.load(kMission);
  expect(back && back->participant_id == s.participant_id && back->focus == s.focus &&
             back->session_token == "secret",
         "load returns what was saved");
  expect(session_to_json(*back).find("secret") == std::string::npos, "token redacted in output");

  OpError err;
  expect(store.ensure_joined(kMission, &err).has_value(), "joined");
  expect(!store.ensure_joined("M-none", &err) && err.code == ErrorCode::not_joined, "not joined");

  expect(!store.update(kMission, [](SessionState& st) { st.drive_intent = DriveIntent::active; }),
         "update");
  expect(store.load(kMission)->drive_intent == DriveIntent::active, "update persisted");
  expect(store.update("M-none", [](SessionState&) {}).code == ErrorCode::not_joined,
         "update requires a session");
}

void test_session_integrity_rules() {
  SessionState s = sample_session(kMission);
  expect(validate_integrity(s).empty(), "valid session");
  s.role = "architect";
  expect(validate_integrity(s).size() == 1, "non-canonical role");
  s.role = "reviewer";
  s.participant_id = "p1";
  expect(validate_integrity(s).size() == 1, "participant id must be a 26-char id");
  s = sample_session(kMission);
  s.joined_at = "2025-10-19T09:00:00.000Z";
  expect(validate_integrity(s).size() == 1, "joined_at after last_activity_at");
}

void test_active_mission_resolution() {
  TempHome home("session_active");
  SessionStore store(home.path.string());
  OpError err;
  expect(!store.resolve_mission_id(std::nullopt, &err) && err.code == ErrorCode::no_active_mission,
         "no pointer, no flag → error");
  expect(!store.set_active_mission(kMission), "set pointer");
  expect(store.resolve_mission_id(std::nullopt, &err) == kMission, "pointer used");
  expect(store.resolve_mission_id(std::string("M-explicit"), &err) == std::string("M-explicit"),
         "explicit id wins");
}

// ============================================================================
// Phase 9: Collaboration service
// ============================================================================

Config test_config(const fs::path& home) {
  Config c;
  c.home = home.string();
  c.api_url = "http://svc";
  c.auth_token = "auth-token";
  return c;
}

struct ServiceFixture {
  TempHome home;
  FakeIngestClient client;
  EventQueueStore queue;
  LamportClock clock;
  SessionStore sessions;
  CollaborationService service;

  explicit ServiceFixture(const std::string& name)
      : home(name),
        queue(home.path),
        clock("node-a", LamportClock::default_path(home.path)),
        sessions(home.path.string()),
        service(ServiceDeps{queue, clock, sessions, client, RetryPolicy::zero_delay(),
                            [](std::chrono::milliseconds) {}, test_config(home.path)}) {
    client.join_response.ok = true;
    client.join_response.participant_id = generate_id();
    client.join_response.session_token = "session-token";
    client.join_response.mission_run_id = "run-7";
    client.join_response.display_name = "Dev One";
  }

  std::string join(const std::string& role = "developer") {
    const auto r = service.join_mission(kMission, role);
    expect(r.ok, "join succeeds: " + r.error.message);
    return r.participant_id;
  }

  // Another participant's history, as if replayed from another node.
  std::string remote_driver(const std::string& focus) {
    LamportClock other("node-b", LamportClock::default_path(home.path));
    const std::string pid = generate_id();
    expect(!queue.append(kMission, joined(other, pid)), "remote join");
    expect(!queue.append(kMission, focused(other, pid, focus)), "remote focus");
    expect(!queue.append(kMission, driving(other, pid, DriveIntent::active)), "remote drive");
    return pid;
  }

  size_t log_size() const { return queue.read_all(kMission).size(); }
};

void test_service_join() {
  ServiceFixture f("svc_join");
  const std::string pid = f.join();
  expect(pid == f.client.join_response.participant_id, "participant id issued remotely");

  const auto session = f.sessions.load(kMission);
  expect(session && session->session_token == "session-token" && session->mission_run_id == "run-7",
         "session cached");
  OpError err;
  expect(f.sessions.resolve_mission_id(std::nullopt, &err) == kMission, "active mission set");

  const auto all = f.queue.read_all(kMission);
  expect(all.size() == 1 && all[0].event.event_type == EventType::participant_joined, "joined event");
  expect(all[0].replay_status == ReplayStatus::delivered, "delivered immediately when online");
  const auto& payload = std::get<ParticipantJoinedPayload>(all[0].event.payload);
  expect(payload.display_name == std::optional<std::string>("Dev One"), "display name carried");
  expect(f.client.last_token == "session-token", "events sent with the session token");

  ServiceFixture bad("svc_join_bad");
  const auto r = bad.service.join_mission(kMission, "architect");
  expect(!r.ok && r.error.code == ErrorCode::invalid_input, "non-canonical role rejected");
  expect(bad.client.join_calls == 0, "rejected before contacting the service");

  ServiceFixture refused("svc_join_refused");
  refused.client.join_response = parse_join_response(403, "", "");
  const auto r2 = refused.service.join_mission(kMission, "developer");
  expect(!r2.ok && r2.error.code == ErrorCode::join_failed, "remote refusal → join_failed");
  expect(!refused.sessions.load(kMission), "no session cached on failure");
}

void test_service_requires_join() {
  ServiceFixture f("svc_not_joined");
  const auto r = f.service.set_focus(kMission, "wp:WP01");
  expect(!r.ok && r.error.code == ErrorCode::not_joined, "not joined");
  expect(f.log_size() == 0, "nothing written");
}

void test_service_offline_emission_is_queued() {
  ServiceFixture f("svc_offline");
  f.join();
  f.client.online = false;
  const auto r = f.service.set_focus(kMission, "wp:WP01");
  expect(r.ok && r.queued, "operation succeeds with queued advisory");
  expect(service_result_to_json(r).find("queued; will sync when online") != std::string::npos,
         "advisory rendered");
  expect(f.queue.read_pending(kMission).size() == 1, "event stays pending");

  f.client.online = true;
  const auto synced = f.service.sync(kMission);
  expect(synced.ok && synced.report.accepted.size() == 1, "sync delivers it later");
  expect(f.queue.read_pending(kMission).empty(), "queue drained");
}

void test_service_self_transitions_emit_nothing() {
  ServiceFixture f("svc_noop");
  f.join();
  expect(f.service.set_focus(kMission, "wp:WP01").emitted.size() == 1, "focus change emits");
  const size_t n = f.log_size();
  const auto again = f.service.set_focus(kMission, "wp:WP01");
  expect(again.ok && again.noop && again.emitted.empty(), "same focus is a no-op");
  const auto drive = f.service.set_drive(kMission, DriveIntent::inactive);
  expect(drive.ok && drive.noop, "inactive → inactive is a no-op");
  expect(f.log_size() == n, "no events written");

  const auto bad = f.service.set_focus(kMission, "task:1");
  expect(!bad.ok && bad.error.code == ErrorCode::invalid_input, "malformed focus rejected");
  expect(f.log_size() == n, "still nothing written");

  const auto change = f.service.set_focus(kMission, "step:review");
  const auto& payload = std::get<FocusChangedPayload>(
      f.queue.find(kMission, change.emitted[0])->event.payload);
  expect(payload.previous_focus_target == parse_focus("wp:WP01"), "previous focus released");
}

void test_service_collision_and_continue() {
  ServiceFixture f("svc_collision");
  const std::string p1 = f.remote_driver("wp:WP01");
  const std::string me = f.join();
  f.service.set_focus(kMission, "wp:WP01");

  const auto r = f.service.set_drive(kMission, DriveIntent::active);
  expect(r.ok && r.collision.has_value(), "collision reported");
  expect(r.collision->severity == Severity::medium, "exactly one other driver → medium");
  expect(r.collision->conflicting_participants[0].participant_id == p1, "conflict is p1");
  expect(r.drive_intent == DriveIntent::inactive, "transition suspended");
  expect(f.sessions.load(kMission)->drive_intent == DriveIntent::inactive, "session still inactive");
  expect(build_roster(f.queue, kMission).at(me).drive_intent == DriveIntent::inactive,
         "no DriveIntentSet written");

  const std::string warning_id = r.collision->warning_id;
  const auto ack = f.service.acknowledge(kMission, warning_id, "continue");
  expect(ack.ok && ack.emitted.size() == 2, "ack + drive set emitted");
  const auto ack_event = f.queue.find(kMission, ack.emitted[0])->event;
  expect(ack_event.event_type == EventType::warning_acknowledged, "acknowledgement recorded");
  expect(ack_event.causation_id == warning_id, "causation points at the warning event");
  expect(f.queue.find(kMission, ack.emitted[1])->event.event_type == EventType::drive_intent_set,
         "drive re-issued without the check");
  expect(ack.drive_intent == DriveIntent::active, "now active");
  expect(build_roster(f.queue, kMission).at(me).drive_intent == DriveIntent::active,
         "roster shows active");
}

void test_service_high_severity_with_two_drivers() {
  ServiceFixture f("svc_high");
  f.remote_driver("wp:WP01");
  f.remote_driver("wp:WP01");
  f.join();
  f.service.set_focus(kMission, "wp:WP01");
  const auto r = f.service.set_drive(kMission, DriveIntent::active);
  expect(r.collision && r.collision->severity == Severity::high, "two others → high");
  expect(f.queue.find(kMission, r.collision->warning_id)->event.event_type ==
             EventType::concurrent_driver_warning,
         "ConcurrentDriverWarning emitted");
}

void test_service_local_failure_leaves_no_trace() {
  ServiceFixture f("svc_io_failure");
  // A regular file where the queue directory belongs: every append fails.
  spit(f.home.path / "queues", "not a directory");
  const auto r = f.service.join_mission(kMission, "developer");
  expect(!r.ok && r.error.code == ErrorCode::io_failure, "join reports io_failure");
  expect(!f.sessions.load(kMission), "no session cached");
  expect(!f.sessions.active_mission(), "no active mission");
  OpError err;
  expect(!f.sessions.ensure_joined(kMission, &err) && err.code == ErrorCode::not_joined,
         "later operations still require a join");
  expect(f.service.set_focus(kMission, "wp:WP01").error.code == ErrorCode::not_joined,
         "focus refused without a session");

  ServiceFixture g("svc_rollback");
  const std::string pid = g.join();
  expect(g.service.set_focus(kMission, "wp:WP01").ok, "initial focus");
  const auto before = g.sessions.load(kMission);
  const size_t logged_before = g.log_size();

  // A directory in place of the stream lock file makes the next append fail.
  const fs::path lock = g.home.path / "queues" / (kMission + ".lock");
  fs::remove(lock);
  fs::create_directories(lock);
  const auto focus = g.service.set_focus(kMission, "wp:WP02");
  expect(!focus.ok && focus.error.code == ErrorCode::io_failure, "focus reports io_failure");
  const auto drive = g.service.set_drive(kMission, DriveIntent::active);
  expect(!drive.ok && drive.error.code == ErrorCode::io_failure, "drive reports io_failure");
  const auto after = g.sessions.load(kMission);
  expect(after && after->focus == before->focus && after->drive_intent == DriveIntent::inactive &&
             after->last_activity_at == before->last_activity_at,
         "cached session rolled back");
  expect(g.log_size() == logged_before, "nothing appended");

  fs::remove_all(lock);
  const auto retried = g.service.set_focus(kMission, "wp:WP02");
  expect(retried.ok && retried.emitted.size() == 1, "retry succeeds once the queue is writable");
  const auto roster = build_roster(g.queue, kMission);
  expect(roster.size() == 1 && roster.at(pid).focus == parse_focus("wp:WP02"),
         "roster matches session");
}

void test_service_acknowledgement_actions() {
  ServiceFixture f("svc_ack");
  const std::string p1 = f.remote_driver("wp:WP01");
  f.join();
  f.service.set_focus(kMission, "wp:WP01");
  const std::string warning_id = f.service.set_drive(kMission, DriveIntent::active).collision->warning_id;

  const size_t n = f.log_size();
  const auto bad = f.service.acknowledge(kMission, warning_id, "ignore");
  expect(!bad.ok && bad.error.code == ErrorCode::invalid_input, "unknown action rejected");
  expect(f.log_size() == n, "invalid acknowledgement writes nothing");

  const auto hold = f.service.acknowledge(kMission, warning_id, "hold");
  expect(hold.ok && hold.emitted.size() == 1 && hold.drive_intent == DriveIntent::inactive,
         "hold: acknowledgement only, stays inactive");

  const auto defer = f.service.acknowledge(kMission, warning_id, "defer");
  expect(defer.ok && defer.emitted.size() == 1, "defer: acknowledgement only");

  const auto reassign = f.service.acknowledge(kMission, warning_id, "reassign");
  expect(reassign.ok && reassign.emitted.size() == 2, "reassign: ack + comment");
  const auto comment = f.queue.find(kMission, reassign.emitted[1])->event;
  const auto& payload = std::get<CommentPostedPayload>(comment.payload);
  expect(payload.mentions == std::vector<std::string>{p1}, "comment mentions the conflicting driver");
  expect(comment.causation_id == reassign.emitted[0], "comment caused by the acknowledgement");
  expect(f.sessions.load(kMission)->drive_intent == DriveIntent::inactive,
         "reassign changes no state");
}

void test_service_comment_and_decision() {
  ServiceFixture f("svc_comment");
  f.join();
  const auto empty = f.service.post_comment(kMission, "   ");
  expect(!empty.ok && empty.error.code == ErrorCode::invalid_input, "empty comment rejected");

  const auto r = f.service.post_comment(kMission, std::string(700, 'a'));
  expect(r.ok && is_valid_id(r.record_id), "comment posted");
  const auto& c = std::get<CommentPostedPayload>(f.queue.find(kMission, r.emitted[0])->event.payload);
  expect(c.content.size() == 500, "comment truncated to 500 characters");

  auto d = f.service.capture_decision(kMission, "use optimistic merge");
  const auto& d1 = std::get<DecisionCapturedPayload>(f.queue.find(kMission, d.emitted[0])->event.payload);
  expect(d1.topic == "mission" && d1.chosen_option == "use optimistic merge", "topic defaults to mission");

  f.service.set_focus(kMission, "step:design");
  d = f.service.capture_decision(kMission, "split the module", std::string("smaller reviews"));
  const auto& d2 = std::get<DecisionCapturedPayload>(f.queue.find(kMission, d.emitted[0])->event.payload);
  expect(d2.topic == "step:design" && d2.rationale == std::optional<std::string>("smaller reviews"),
         "topic follows focus");

  expect(!f.service.capture_decision(kMission, "").ok, "empty decision rejected");
}

void test_service_status_surfaces_rejections_and_requeue() {
  ServiceFixture f("svc_status");
  f.join();
  f.client.online = false;
  const auto comment = f.service.post_comment(kMission, "hello");
  f.client.online = true;
  f.client.verdicts[comment.emitted[0]] =
      EventVerdict{VerdictStatus::rejected, "participant not in mission roster"};

  const auto synced = f.service.sync(kMission);
  expect(synced.ok && synced.report.rejected.size() == 1, "rejection reported by sync");

  const auto status = f.service.status(kMission);
  expect(status.ok && status.queue.failed == 1, "status counts failed entries");
  expect(!status.warnings.empty() && status.warnings[0].find("rejected") != std::string::npos,
         "status warns about rejections");
  expect(status.roster.size() == 1 && status.logical_clock >= 2, "roster and clock reported");

  const auto requeued = f.service.requeue_failed(kMission);
  expect(requeued.ok && requeued.requeued == 1, "requeue moves the failed entry");
  f.client.verdicts.clear();
  expect(f.service.sync(kMission).report.accepted.size() == 1, "re-replay delivers");
  expect(f.service.status(kMission).queue.failed == 0, "no failures left");
}

// ============================================================================
// Phase 10: Configuration, node identity, observability
// ============================================================================

void test_config_precedence() {
  TempHome home("config_precedence");
  spit(home.path / "config.json",
       "{\"api_url\":\"http://file\",\"batch_size\":50,\"max_retries\":5,\"auth_token\":\"file-tok\"}");
  std::map<std::string, std::string> env{{"CONCORD_HOME", home.path.string()},
                                         {"CONCORD_API_URL", "http://env/"},
                                         {"CONCORD_MAX_RETRIES", "oops"}};
  const EnvLookup lookup = [&env](const std::string& k) -> std::optional<std::string> {
    auto it = env.find(k);
    if (it == env.end()) return std::nullopt;
    return it->second;
  };

  ConfigOverrides flags;
  Config c = load_config(flags, lookup);
  expect(c.home == home.path.string(), "home from env");
  expect(c.api_url == "http://env", "env beats file, trailing slash trimmed");
  expect(c.batch_size == 50, "file beats default");
  expect(c.max_retries == 5 && !c.warnings.empty(), "bad env number ignored with a warning");
  expect(c.http_timeout_ms == 10000 && c.connect_timeout_ms == 3000, "timeout defaults");

  flags.api_url = "http://flag";
  flags.batch_size = 7;
  c = load_config(flags, lookup);
  expect(c.api_url == "http://flag" && c.batch_size == 7, "flags beat everything");

  const std::string json = config_to_json(c);
  expect(json.find("file-tok") == std::string::npos && json.find("***") != std::string::npos,
         "token redacted");
}

void test_command_args_split() {
  const auto c = split_command_args({"comment", "--reply-to", "C-1", "looks good"});
  expect(c.error.empty(), "no error");
  expect(c.positional == std::vector<std::string>({"comment", "looks good"}),
         "option value is not taken as the comment text");
  expect(c.options.at("--reply-to") == "C-1", "option value kept");

  const auto j = split_command_args({"join", "M-1", "--role", "developer"});
  expect(j.positional.size() == 2 && j.options.at("--role") == "developer", "join args");

  const auto bad = split_command_args({"join", "M-1", "--role"});
  expect(bad.error == "--role requires a value", "dangling option reported");
}

void test_node_identity() {
  const NodeIdentity explicit_node = resolve_node_identity("node-x");
  expect(explicit_node.node_id == "node-x", "explicit node id wins");
  const NodeIdentity n = resolve_node_identity();
  expect(!n.node_id.empty() && !n.hostname.empty(), "default node id resolved");
  expect(node_identity_to_json(explicit_node).find("\"node_id\":\"node-x\"") != std::string::npos,
         "json");
}

void test_log_records_and_stats_json() {
  g_logs.clear();
  log_warn("queue", "line skipped", {{"k", "v\"q"}});
  expect(g_logs.size() == 1 && g_logs[0].fields.at("k") == "v\"q", "hook receives records");
  const std::string line = log_record_to_json(g_logs[0]);
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(line, &err);
  expect(!err && jsonlite::get_string(obj, "level") == "warn" &&
             jsonlite::get_string(obj, "component") == "queue",
         "record serialises as one JSON object");

  set_min_log_level(LogLevel::error);
  log_warn("queue", "suppressed");
  expect(g_logs.size() == 1, "records below the minimum level dropped");
  set_min_log_level(LogLevel::debug);

  jsonlite::parse(global_sync_stats().to_json(), &err);
  expect(!err, "stats JSON parses");
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(version::manifest_to_json(m), &err);
  expect(!err, "manifest is valid JSON");
  expect(jsonlite::get_u64(obj, "queue_format") == version::QUEUE_FORMAT_VERSION,
         "queue format version published");
}

}  // namespace

int main() {
  set_log_hook(capture_log);
  set_min_log_level(LogLevel::debug);

  std::cout << "=== concord tests ===\n";

  std::cout << "\n[Phase 1] Primitives\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hash domain separation", test_hash_domain_separation);
  run_test("jsonlite strictness", test_jsonlite_strictness);
  run_test("ISO-8601 format/parse", test_iso8601_roundtrip);

  std::cout << "\n[Phase 2] Identifiers\n";
  run_test("10,000 ids unique and sorted", test_ulid_unique_and_sorted);
  run_test("same-millisecond monotonic", test_ulid_same_millisecond_monotonic);
  run_test("id validation", test_ulid_validation);

  std::cout << "\n[Phase 3] Lamport clock\n";
  run_test("persists across instances", test_lamport_persists_across_instances);
  run_test("nodes do not cross-contaminate", test_lamport_nodes_do_not_cross_contaminate);
  run_test("shared node id never repeats", test_lamport_shared_node_id_never_repeats);
  run_test("corrupt file resets to zero", test_lamport_corrupt_file_resets);

  std::cout << "\n[Phase 4] Event model\n";
  run_test("envelope validation", test_envelope_validation);
  run_test("focus formats", test_focus_formats);
  run_test("UTF-8 truncation", test_comment_truncation_helpers);

  std::cout << "\n[Phase 5] Event queue store\n";
  run_test("append order + logical clock", test_queue_append_order_and_clock);
  run_test("entry round-trip for every status", test_queue_entry_roundtrip_all_statuses);
  run_test("corrupt and truncated lines skipped", test_queue_skips_corrupt_and_truncated_lines);
  run_test("digest mismatch skipped", test_queue_rejects_digest_mismatch);
  run_test("foreign aggregate ignored", test_queue_ignores_foreign_aggregate);
  run_test("stamped append under a shared node id", test_queue_stamped_append_serializes_shared_node);
  run_test("update_status + requeue_failed", test_queue_update_status_and_requeue);

  std::cout << "\n[Phase 6] Replay transport\n";
  run_test("duplicate + rejected verdicts", test_replay_duplicate_and_rejected_verdicts);
  run_test("timeout leaves pending, next replay retries", test_replay_timeout_leaves_pending_then_retries);
  run_test("transient then success", test_replay_transient_then_success);
  run_test("delivered entries not resent", test_replay_delivered_is_noop);
  run_test("batches capped at max size", test_replay_batches_of_at_most_max);
  run_test("missing verdict stays pending", test_replay_missing_verdict_stays_pending);
  run_test("batch-level 4xx / 401", test_replay_batch_level_outcomes);
  run_test("response classification", test_batch_response_classification);
  run_test("retry policy schedule", test_retry_policy_schedule);
  run_test("deliver_now single attempt", test_deliver_now_single_attempt);

  std::cout << "\n[Phase 7] Roster + collision detection\n";
  run_test("roster fold rules", test_roster_fold_rules);
  run_test("collision severity levels", test_collision_severity_levels);
  run_test("inactive and unknown participants", test_collision_ignores_inactive_and_unknown);

  std::cout << "\n[Phase 8] Session cache\n";
  run_test("session store round-trip", test_session_store_roundtrip);
  run_test("session integrity rules", test_session_integrity_rules);
  run_test("active mission resolution", test_active_mission_resolution);

  std::cout << "\n[Phase 9] Collaboration service\n";
  run_test("join", test_service_join);
  run_test("operations require a session", test_service_requires_join);
  run_test("offline emission queued", test_service_offline_emission_is_queued);
  run_test("self-transitions emit nothing", test_service_self_transitions_emit_nothing);
  run_test("collision then continue", test_service_collision_and_continue);
  run_test("high severity with two drivers", test_service_high_severity_with_two_drivers);
  run_test("local failure leaves no trace", test_service_local_failure_leaves_no_trace);
  run_test("acknowledgement actions", test_service_acknowledgement_actions);
  run_test("comment + decision", test_service_comment_and_decision);
  run_test("status surfaces rejections, requeue", test_service_status_surfaces_rejections_and_requeue);

  std::cout << "\n[Phase 10] Configuration + observability\n";
  run_test("config precedence", test_config_precedence);
  run_test("command args split", test_command_args_split);
  run_test("node identity", test_node_identity);
  run_test("log records + stats JSON", test_log_records_and_stats_json);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
