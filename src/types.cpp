#include "concord/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace concord {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::io_failure: return "io_failure";
    case ErrorCode::corrupt_record: return "corrupt_record";
    case ErrorCode::transient_network: return "transient_network";
    case ErrorCode::remote_rejected: return "remote_rejected";
    case ErrorCode::invalid_input: return "invalid_input";
    case ErrorCode::not_joined: return "not_joined";
    case ErrorCode::no_active_mission: return "no_active_mission";
    case ErrorCode::join_failed: return "join_failed";
  }
  return "";
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          SC::now().time_since_epoch())
          .count());
}

std::string format_iso8601(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  const unsigned millis = static_cast<unsigned>(unix_ms % 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, millis);
  return buf;
}

std::optional<uint64_t> parse_iso8601(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month,
                  &day, &hour, &minute, &second, &consumed) != 6) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }

  size_t pos = static_cast<size_t>(consumed);
  unsigned millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    unsigned scale = 100;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += static_cast<unsigned>(text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }
  const std::string zone = text.substr(pos);
  if (!zone.empty() && zone != "Z" && zone != "+00:00") return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;
  const std::time_t secs = timegm(&tm);
  if (secs < 0) return std::nullopt;
  return static_cast<uint64_t>(secs) * 1000u + millis;
}

}  // namespace concord
