#include "concord/lamport.hpp"

#include <algorithm>
#include <sstream>

#include "concord/file_io.hpp"
#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"

namespace concord {

LamportClock::LamportClock(std::string node_id, std::filesystem::path clock_file)
    : node_id_(std::move(node_id)), path_(std::move(clock_file)) {
  const auto counters = load();
  auto it = counters.find(node_id_);
  if (it != counters.end()) cached_ = it->second;
}

std::filesystem::path LamportClock::default_path(const std::filesystem::path& home) {
  return home / "events" / "lamport_clock.json";
}

std::map<std::string, uint64_t> LamportClock::load() const {
  std::map<std::string, uint64_t> out;
  const auto text = read_file(path_);
  if (!text || text->empty()) return out;

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) {
    log_warn("clock", "corrupt clock file, starting from zero",
             {{"path", path_.string()}, {"error", err->message}});
    return out;
  }
  for (const auto& [key, value] : obj) {
    if (const auto* n = std::get_if<std::uint64_t>(&value.v)) {
      out[key] = *n;
    } else {
      log_warn("clock", "ignoring non-integer clock entry", {{"node_id", key}});
    }
  }
  return out;
}

std::optional<uint64_t> LamportClock::advance(uint64_t floor, std::string* error) {
  std::filesystem::path lock_path = path_;
  lock_path += ".lock";
  FileLock lock(lock_path);
  if (!lock.locked()) {
    if (error) *error = lock.error();
    return std::nullopt;
  }

  auto counters = load();
  const uint64_t on_disk = counters.count(node_id_) ? counters[node_id_] : 0;
  const uint64_t next = std::max({on_disk, cached_, floor}) + 1;
  counters[node_id_] = next;

  jsonlite::Object obj;
  for (const auto& [key, value] : counters) obj[key] = jsonlite::Value{std::uint64_t{value}};
  if (!atomic_write(path_, jsonlite::to_json(obj), error)) return std::nullopt;

  cached_ = next;
  return next;
}

std::optional<uint64_t> LamportClock::increment(std::string* error) {
  return advance(0, error);
}

std::optional<uint64_t> LamportClock::observe(uint64_t remote, std::string* error) {
  return advance(remote, error);
}

uint64_t LamportClock::current() const {
  const auto counters = load();
  auto it = counters.find(node_id_);
  const uint64_t on_disk = it == counters.end() ? 0 : it->second;
  return std::max(on_disk, cached_);
}

std::map<std::string, uint64_t> LamportClock::snapshot() const {
  return load();
}

}  // namespace concord
