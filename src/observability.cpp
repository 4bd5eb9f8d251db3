#include "concord/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "concord/jsonlite.hpp"
#include "concord/types.hpp"

namespace concord {

namespace {

std::mutex g_log_mu;
LogHook g_log_hook = nullptr;
std::string g_log_path;
bool g_log_path_resolved = false;
std::atomic<int> g_min_level{-1};

LogLevel level_from_env() {
  const char* e = std::getenv("CONCORD_LOG_LEVEL");
  if (!e || !e[0]) return LogLevel::warn;
  const std::string s(e);
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "error") return LogLevel::error;
  return LogLevel::warn;
}

// Caller holds g_log_mu.
const std::string& resolved_log_path() {
  if (!g_log_path_resolved) {
    const char* e = std::getenv("CONCORD_LOG");
    if (e && e[0]) g_log_path = e;
    g_log_path_resolved = true;
  }
  return g_log_path;
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::string log_record_to_json(const LogRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"ts\":\"" << format_iso8601(r.timestamp_unix_ms) << "\""
    << ",\"level\":\"" << to_string(r.level) << "\""
    << ",\"component\":\"" << jsonlite::escape(r.component) << "\""
    << ",\"message\":\"" << jsonlite::escape(r.message) << "\"";
  for (const auto& [k, v] : r.fields) {
    o << ",\"" << jsonlite::escape(k) << "\":\"" << jsonlite::escape(v) << "\"";
  }
  o << "}";
  return o.str();
}

void log_event(LogLevel level, const std::string& component,
               const std::string& message,
               const std::map<std::string, std::string>& fields) {
  if (static_cast<int>(level) < static_cast<int>(min_log_level())) return;

  LogRecord r;
  r.level = level;
  r.component = component;
  r.message = message;
  r.fields = fields;
  r.timestamp_unix_ms = now_unix_ms();

  std::lock_guard<std::mutex> lk(g_log_mu);
  if (g_log_hook) {
    g_log_hook(r);
    return;
  }

  const std::string line = log_record_to_json(r) + "\n";
  const std::string& path = resolved_log_path();
  if (path.empty()) {
    std::fwrite(line.data(), 1, line.size(), stderr);
    return;
  }
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void set_log_hook(LogHook hook) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_hook = hook;
}

void set_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
  g_log_path_resolved = true;
}

void set_min_log_level(LogLevel level) {
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel min_log_level() {
  int v = g_min_level.load(std::memory_order_relaxed);
  if (v < 0) {
    v = static_cast<int>(level_from_env());
    g_min_level.store(v, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(v);
}

// ---------------------------------------------------------------------------
// SyncStats
// ---------------------------------------------------------------------------

std::string SyncStats::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"appends\":" << appends.load(std::memory_order_relaxed)
    << ",\"corrupt_lines_skipped\":" << corrupt_lines_skipped.load(std::memory_order_relaxed)
    << ",\"status_rewrites\":" << status_rewrites.load(std::memory_order_relaxed)
    << ",\"batches_sent\":" << batches_sent.load(std::memory_order_relaxed)
    << ",\"events_accepted\":" << events_accepted.load(std::memory_order_relaxed)
    << ",\"events_duplicate\":" << events_duplicate.load(std::memory_order_relaxed)
    << ",\"events_rejected\":" << events_rejected.load(std::memory_order_relaxed)
    << ",\"transient_failures\":" << transient_failures.load(std::memory_order_relaxed)
    << ",\"retries\":" << retries.load(std::memory_order_relaxed)
    << ",\"collisions_detected\":" << collisions_detected.load(std::memory_order_relaxed)
    << "}";
  return o.str();
}

void SyncStats::reset() {
  appends.store(0);
  corrupt_lines_skipped.store(0);
  status_rewrites.store(0);
  batches_sent.store(0);
  events_accepted.store(0);
  events_duplicate.store(0);
  events_rejected.store(0);
  transient_failures.store(0);
  retries.store(0);
  collisions_detected.store(0);
}

SyncStats& global_sync_stats() {
  static SyncStats stats;
  return stats;
}

}  // namespace concord
