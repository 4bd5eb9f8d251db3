#pragma once

// concord/types.hpp — Error taxonomy and time primitives shared by every module.
//
// ERROR MODEL:
//   No exceptions cross a module boundary. Operations report failure through
//   result structs carrying `ok` + ErrorCode, through std::optional for absent
//   values, or through bool + std::string* error for low-level I/O.
//
//   io_failure         queue append / clock or session persistence failed.
//                      Fatal to the current operation, never swallowed.
//   corrupt_record     one malformed queue line. Logged and skipped.
//   transient_network  timeout, connection error, 5xx. Retried with backoff,
//                      entries stay pending.
//   remote_rejected    definitive rejection by the ingestion service.
//                      Entry marked failed, never retried automatically.
//   invalid_input      bad domain input (unknown acknowledgement, empty
//                      comment, malformed focus). Rejected before any write.
//   not_joined         no valid cached session for the mission.
//   no_active_mission  no --mission flag and no active mission pointer.
//   join_failed        the mission service refused the join.
//
// TIME:
//   Wall-clock timestamps are advisory only. They are carried as unix
//   milliseconds in memory and as ISO-8601 UTC strings on disk and on the wire.
//   Nothing in this engine orders events by wall-clock time.

#include <cstdint>
#include <optional>
#include <string>

namespace concord {

enum class ErrorCode {
  none,
  io_failure,
  corrupt_record,
  transient_network,
  remote_rejected,
  invalid_input,
  not_joined,
  no_active_mission,
  join_failed,
};

std::string to_string(ErrorCode code);

struct OpError {
  ErrorCode   code{ErrorCode::none};
  std::string message;

  explicit operator bool() const { return code != ErrorCode::none; }
};

// Current wall-clock time in unix milliseconds.
uint64_t now_unix_ms();

// "2026-10-19T08:15:30.250Z". Always UTC, always millisecond precision.
std::string format_iso8601(uint64_t unix_ms);

// Accepts the format produced by format_iso8601() plus the common variants
// without fractional seconds or with a "+00:00" suffix. Returns nullopt on
// anything else.
std::optional<uint64_t> parse_iso8601(const std::string& text);

}  // namespace concord
