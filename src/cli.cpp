#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "concord/config.hpp"
#include "concord/ingest_client.hpp"
#include "concord/jsonlite.hpp"
#include "concord/lamport.hpp"
#include "concord/node.hpp"
#include "concord/observability.hpp"
#include "concord/queue_store.hpp"
#include "concord/replay.hpp"
#include "concord/service.hpp"
#include "concord/session.hpp"
#include "concord/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCollision = 3;

void print_usage() {
  std::cerr
      << "usage: concord [--mission <id>] [--home <dir>] [--api-url <url>] [--node-id <id>] <command>\n"
      << "  join <mission> --role <developer|reviewer|observer|stakeholder>\n"
      << "  focus set <wp:<id>|step:<id>|none>\n"
      << "  drive set <active|inactive> [--ack <continue|hold|reassign|defer>]\n"
      << "  ack <warning_id> <continue|hold|reassign|defer>\n"
      << "  comment <text> [--reply-to <comment_id>]\n"
      << "  decide <text> [--rationale <text>] [--warning <warning_id>]\n"
      << "  status | sync [--batch N] | requeue\n"
      << "  queue show [--status pending|delivered|failed]\n"
      << "  clock show | config show | version\n";
}

int usage_error(const std::string& message) {
  std::cerr << "{\"error\":\"" << concord::jsonlite::escape(message) << "\"}\n";
  print_usage();
  return kExitUsage;
}

int print_error(const concord::OpError& e) {
  std::cout << "{\"ok\":false,\"error\":{\"code\":\"" << concord::to_string(e.code)
            << "\",\"message\":\"" << concord::jsonlite::escape(e.message) << "\"}}\n";
  return kExitError;
}

int print_result(const concord::ServiceResult& r) {
  std::cout << concord::service_result_to_json(r) << "\n";
  if (!r.ok) return kExitError;
  return r.collision ? kExitCollision : kExitOk;
}

std::optional<uint32_t> parse_count(const std::string& s) {
  if (s.empty() || s.size() > 9) return std::nullopt;
  uint32_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  return v;
}

// Everything one invocation needs, built from the effective configuration.
struct Runtime {
  concord::Config config;
  concord::NodeIdentity node;
  std::unique_ptr<concord::EventQueueStore> queue;
  std::unique_ptr<concord::LamportClock> clock;
  std::unique_ptr<concord::SessionStore> sessions;
  std::unique_ptr<concord::HttpIngestClient> client;
  std::unique_ptr<concord::CollaborationService> service;

  explicit Runtime(concord::Config c) : config(std::move(c)) {
    node = concord::resolve_node_identity(config.node_id);
    queue = std::make_unique<concord::EventQueueStore>(config.home);
    clock = std::make_unique<concord::LamportClock>(
        node.node_id, concord::LamportClock::default_path(config.home));
    sessions = std::make_unique<concord::SessionStore>(config.home);
    client = std::make_unique<concord::HttpIngestClient>(concord::HttpClientOptions{
        config.api_url, config.http_timeout_ms, config.connect_timeout_ms});

    concord::RetryPolicy policy;
    policy.max_attempts = config.max_retries;
    policy.base_delay_ms = config.backoff_base_ms;
    service = std::make_unique<concord::CollaborationService>(concord::ServiceDeps{
        *queue, *clock, *sessions, *client, policy, concord::thread_sleeper(), config});
  }
};

std::string queue_entries_to_json(const std::string& mission_id,
                                  const std::vector<concord::QueueEntry>& entries) {
  using concord::jsonlite::escape;
  std::ostringstream o;
  o << "{\"ok\":true,\"mission_id\":\"" << escape(mission_id) << "\",\"entries\":[";
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    if (i) o << ",";
    o << "{\"event_id\":\"" << e.event.event_id << "\""
      << ",\"event_type\":\"" << concord::to_string(e.event.event_type) << "\""
      << ",\"participant_id\":\"" << escape(e.event.participant_id()) << "\""
      << ",\"origin_node\":\"" << escape(e.event.origin_node) << "\""
      << ",\"logical_clock\":" << e.event.logical_clock
      << ",\"timestamp\":\"" << escape(e.event.timestamp) << "\""
      << ",\"replay_status\":\"" << concord::to_string(e.replay_status) << "\""
      << ",\"retry_count\":" << e.retry_count
      << ",\"last_retry_at\":";
    if (e.last_retry_at) {
      o << "\"" << escape(*e.last_retry_at) << "\"";
    } else {
      o << "null";
    }
    o << "}";
  }
  o << "]}";
  return o.str();
}

}  // namespace

int main(int argc, char** argv) {
  concord::ConfigOverrides overrides;
  std::optional<std::string> mission_flag;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage();
      return kExitOk;
    }
    if ((a == "--mission" || a == "--home" || a == "--api-url" || a == "--node-id") &&
        i + 1 >= argc) {
      return usage_error(a + " requires a value");
    }
    if (a == "--mission") {
      mission_flag = argv[++i];
    } else if (a == "--home") {
      overrides.home = argv[++i];
    } else if (a == "--api-url") {
      overrides.api_url = argv[++i];
    } else if (a == "--node-id") {
      overrides.node_id = argv[++i];
    } else {
      args.push_back(a);
    }
  }
  concord::CommandArgs split = concord::split_command_args(args);
  if (!split.error.empty()) return usage_error(split.error);
  args = std::move(split.positional);
  if (args.empty()) return usage_error("missing command");

  const std::string cmd = args[0];
  const std::string sub = args.size() >= 2 ? args[1] : "";

  const auto option = [&](const std::string& name) -> std::optional<std::string> {
    auto it = split.options.find(name);
    if (it == split.options.end()) return std::nullopt;
    return it->second;
  };

  if (cmd == "version") {
    std::cout << concord::version::manifest_to_json(concord::version::current_manifest()) << "\n";
    return kExitOk;
  }

  if (cmd == "sync") {
    if (auto b = option("--batch")) {
      const auto n = parse_count(*b);
      if (!n || *n == 0) return usage_error("--batch must be a positive integer");
      overrides.batch_size = *n;
    }
  }

  Runtime rt(concord::load_config(overrides));
  if (!rt.config.log_path.empty()) concord::set_log_path(rt.config.log_path);
  for (const auto& w : rt.config.warnings) concord::log_warn("config", w);

  if (cmd == "config" && sub == "show") {
    std::cout << "{\"config\":" << concord::config_to_json(rt.config)
              << ",\"node\":" << concord::node_identity_to_json(rt.node) << "}\n";
    return kExitOk;
  }

  if (cmd == "join") {
    if (args.size() < 2) return usage_error("join requires <mission>");
    const auto role = option("--role");
    if (!role) return usage_error("join requires --role <role>");
    return print_result(rt.service->join_mission(args[1], *role));
  }

  // Every remaining command works on a resolved mission.
  const auto resolve = [&](concord::OpError* err) {
    return rt.sessions->resolve_mission_id(mission_flag, err);
  };

  if (cmd == "focus" && sub == "set") {
    if (args.size() < 3) return usage_error("focus set requires <target>");
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    return print_result(rt.service->set_focus(*mission, args[2]));
  }

  if (cmd == "drive" && sub == "set") {
    if (args.size() < 3) return usage_error("drive set requires <active|inactive>");
    const auto intent = concord::parse_drive_intent(args[2]);
    if (!intent) return usage_error("drive intent must be active or inactive");
    const auto ack = option("--ack");
    if (ack && !concord::parse_ack_action(*ack)) {
      return usage_error("--ack must be continue, hold, reassign or defer");
    }
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);

    concord::ServiceResult r = rt.service->set_drive(*mission, *intent);
    if (!r.ok || !r.collision || !ack) return print_result(r);

    // Pre-supplied acknowledgement for the warning just raised.
    concord::ServiceResult acked = rt.service->acknowledge(*mission, r.collision->warning_id, *ack);
    acked.emitted.insert(acked.emitted.begin(), r.emitted.begin(), r.emitted.end());
    acked.queued = acked.queued || r.queued;
    acked.collision = r.collision;
    std::cout << concord::service_result_to_json(acked) << "\n";
    return acked.ok ? kExitOk : kExitError;
  }

  if (cmd == "ack") {
    if (args.size() < 3) return usage_error("ack requires <warning_id> <action>");
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    return print_result(rt.service->acknowledge(*mission, args[1], args[2]));
  }

  if (cmd == "comment") {
    if (args.size() < 2) return usage_error("comment requires <text>");
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    return print_result(rt.service->post_comment(*mission, args[1], option("--reply-to")));
  }

  if (cmd == "decide") {
    if (args.size() < 2) return usage_error("decide requires <text>");
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    return print_result(rt.service->capture_decision(*mission, args[1], option("--rationale"),
                                                     option("--warning")));
  }

  if (cmd == "status") {
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    const auto report = rt.service->status(*mission);
    std::cout << concord::status_report_to_json(report) << "\n";
    return report.ok ? kExitOk : kExitError;
  }

  if (cmd == "sync") {
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    const auto result = rt.service->sync(*mission);
    std::cout << "{\"result\":" << concord::sync_result_to_json(result)
              << ",\"stats\":" << concord::global_sync_stats().to_json() << "}\n";
    return result.ok ? kExitOk : kExitError;
  }

  if (cmd == "requeue") {
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    const auto result = rt.service->requeue_failed(*mission);
    if (!result.ok) return print_error(result.error);
    std::cout << "{\"ok\":true,\"mission_id\":\"" << concord::jsonlite::escape(result.mission_id)
              << "\",\"requeued\":" << result.requeued << "}\n";
    return kExitOk;
  }

  if (cmd == "queue" && sub == "show") {
    concord::OpError err;
    const auto mission = resolve(&err);
    if (!mission) return print_error(err);
    std::optional<concord::ReplayStatus> filter;
    if (auto s = option("--status")) {
      filter = concord::parse_replay_status(*s);
      if (!filter) return usage_error("--status must be pending, delivered or failed");
    }
    std::vector<concord::QueueEntry> entries;
    for (auto& e : rt.queue->read_all(*mission)) {
      if (!filter || e.replay_status == *filter) entries.push_back(std::move(e));
    }
    std::cout << queue_entries_to_json(*mission, entries) << "\n";
    return kExitOk;
  }

  if (cmd == "clock" && sub == "show") {
    std::ostringstream o;
    o << "{\"node_id\":\"" << concord::jsonlite::escape(rt.node.node_id) << "\""
      << ",\"current\":" << rt.clock->current() << ",\"counters\":{";
    bool first = true;
    for (const auto& [node, value] : rt.clock->snapshot()) {
      if (!first) o << ",";
      first = false;
      o << "\"" << concord::jsonlite::escape(node) << "\":" << value;
    }
    o << "}}";
    std::cout << o.str() << "\n";
    return kExitOk;
  }

  return usage_error("unknown command: " + cmd);
}
