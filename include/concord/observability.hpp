#pragma once

// concord/observability.hpp — Structured logging and sync counters.
//
// DESIGN:
//   LogRecord is the canonical observable unit. Every warning the engine
//   raises (corrupt queue line skipped, delivery deferred, clock file reset)
//   becomes one LogRecord, which is:
//     - JSONL-streamed to the configured sink (stderr by default, or the file
//       named by CONCORD_LOG / set_log_path()).
//     - Passed to an optional hook instead, when one is installed (tests).
//
//   Log emission must NEVER fail the operation that logs. Sink write errors
//   are ignored.
//
// EXTENSION_POINT: remote_log_export
//   Current: local JSONL stream only.
//   Upgrade path: forward warn/error records to the ingestion service as a
//   diagnostics batch on the next successful sync.
//   Invariant: records must never contain the session token or comment text,
//   only ids, counts and error codes.

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

namespace concord {

enum class LogLevel { debug, info, warn, error };

std::string to_string(LogLevel level);

struct LogRecord {
  LogLevel    level{LogLevel::info};
  std::string component;   // "queue", "clock", "replay", "service", ...
  std::string message;
  std::map<std::string, std::string> fields;
  uint64_t    timestamp_unix_ms{0};
};

std::string log_record_to_json(const LogRecord& r);

// Emit one record. Records below the minimum level are dropped.
void log_event(LogLevel level, const std::string& component,
               const std::string& message,
               const std::map<std::string, std::string>& fields = {});

inline void log_warn(const std::string& component, const std::string& message,
                     const std::map<std::string, std::string>& fields = {}) {
  log_event(LogLevel::warn, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const std::map<std::string, std::string>& fields = {}) {
  log_event(LogLevel::info, component, message, fields);
}

// Hook registration. The hook receives every record at or above the minimum
// level and replaces the file/stderr sink. Pass nullptr to restore the sink.
using LogHook = void (*)(const LogRecord&);
void set_log_hook(LogHook hook);

// "" restores stderr. Defaults to $CONCORD_LOG when set.
void set_log_path(const std::string& path);

// Defaults to warn, or $CONCORD_LOG_LEVEL (debug|info|warn|error).
void set_min_log_level(LogLevel level);
LogLevel min_log_level();

// ---------------------------------------------------------------------------
// SyncStats: process-wide queue and replay counters
// ---------------------------------------------------------------------------
// All counters are atomic; the engine is single-threaded per process but the
// test harness drives several stores concurrently.
struct SyncStats {
  std::atomic<uint64_t> appends{0};
  std::atomic<uint64_t> corrupt_lines_skipped{0};
  std::atomic<uint64_t> status_rewrites{0};
  std::atomic<uint64_t> batches_sent{0};
  std::atomic<uint64_t> events_accepted{0};
  std::atomic<uint64_t> events_duplicate{0};
  std::atomic<uint64_t> events_rejected{0};
  std::atomic<uint64_t> transient_failures{0};
  std::atomic<uint64_t> retries{0};
  std::atomic<uint64_t> collisions_detected{0};

  std::string to_json() const;
  void reset();
};

SyncStats& global_sync_stats();

}  // namespace concord
