#include "concord/queue_store.hpp"

#include <functional>
#include <sstream>

#include "concord/file_io.hpp"
#include "concord/hash.hpp"
#include "concord/jsonlite.hpp"
#include "concord/observability.hpp"

namespace concord {

namespace {

constexpr const char* kStatusKey = "_replay_status";
constexpr const char* kRetryKey = "_retry_count";
constexpr const char* kLastRetryKey = "_last_retry_at";
constexpr const char* kDigestKey = "_digest";

struct RawLine {
  std::string text;
  bool terminated{true};
};

std::vector<RawLine> split_lines(const std::string& content) {
  std::vector<RawLine> out;
  size_t start = 0;
  while (start < content.size()) {
    const size_t nl = content.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back({content.substr(start), false});
      break;
    }
    out.push_back({content.substr(start, nl - start), true});
    start = nl + 1;
  }
  return out;
}

bool blank(const std::string& s) {
  return s.find_first_not_of(" \t\r") == std::string::npos;
}

// Parsed view of a log file. `entries` holds the valid entries for the stream
// in append order; skipped lines are logged and counted.
std::vector<QueueEntry> load_entries(const std::filesystem::path& path,
                                     const std::string& stream_id) {
  std::vector<QueueEntry> entries;
  const auto content = read_file(path);
  if (!content) return entries;

  const std::string aggregate = aggregate_for_mission(stream_id);
  auto& stats = global_sync_stats();
  size_t line_no = 0;
  for (const auto& raw : split_lines(*content)) {
    ++line_no;
    if (blank(raw.text)) continue;
    if (!raw.terminated) {
      stats.corrupt_lines_skipped.fetch_add(1, std::memory_order_relaxed);
      log_warn("queue", "skipping truncated trailing line",
               {{"stream_id", stream_id}, {"line", std::to_string(line_no)}});
      continue;
    }
    std::string err;
    auto entry = parse_entry_line(raw.text, &err);
    if (!entry) {
      stats.corrupt_lines_skipped.fetch_add(1, std::memory_order_relaxed);
      log_warn("queue", "skipping corrupt line",
               {{"stream_id", stream_id}, {"line", std::to_string(line_no)}, {"error", err}});
      continue;
    }
    if (entry->event.aggregate_id != aggregate) {
      log_warn("queue", "skipping entry for another aggregate",
               {{"stream_id", stream_id}, {"event_id", entry->event.event_id},
                {"aggregate_id", entry->event.aggregate_id}});
      continue;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

// Rewrite every line under an already-held lock. `mutate` returns true when
// it changed the entry. Lines that do not parse are kept verbatim; a
// truncated trailing fragment is dropped.
OpError rewrite_locked(const std::filesystem::path& path, const std::string& stream_id,
                       const std::function<bool(QueueEntry&)>& mutate, uint64_t* changed) {
  const auto content = read_file(path);
  if (!content) return {};

  std::string out;
  out.reserve(content->size());
  uint64_t n = 0;
  for (const auto& raw : split_lines(*content)) {
    if (!raw.terminated) {
      log_warn("queue", "dropping truncated trailing line on rewrite", {{"stream_id", stream_id}});
      continue;
    }
    if (blank(raw.text)) continue;
    std::string err;
    auto entry = parse_entry_line(raw.text, &err);
    if (entry && mutate(*entry)) {
      out += entry_to_line(*entry);
      ++n;
    } else {
      out += raw.text;
    }
    out += '\n';
  }
  if (changed) *changed = n;
  if (n == 0) return {};

  std::string io_err;
  if (!atomic_write(path, out, &io_err, /*owner_only=*/true)) {
    return OpError{ErrorCode::io_failure, io_err};
  }
  global_sync_stats().status_rewrites.fetch_add(1, std::memory_order_relaxed);
  return {};
}

}  // namespace

bool is_valid_stream_id(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0' || c == '\n') return false;
  }
  return true;
}

std::string to_string(ReplayStatus status) {
  switch (status) {
    case ReplayStatus::pending:   return "pending";
    case ReplayStatus::delivered: return "delivered";
    case ReplayStatus::failed:    return "failed";
  }
  return "pending";
}

std::optional<ReplayStatus> parse_replay_status(const std::string& text) {
  if (text == "pending") return ReplayStatus::pending;
  if (text == "delivered") return ReplayStatus::delivered;
  if (text == "failed") return ReplayStatus::failed;
  return std::nullopt;
}

std::string queue_summary_to_json(const QueueSummary& s) {
  std::ostringstream o;
  o << "{"
    << "\"total\":" << s.total
    << ",\"pending\":" << s.pending
    << ",\"delivered\":" << s.delivered
    << ",\"failed\":" << s.failed
    << ",\"failed_event_ids\":[";
  for (size_t i = 0; i < s.failed_event_ids.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(s.failed_event_ids[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

std::string entry_to_line(const QueueEntry& entry) {
  jsonlite::Object obj = envelope_to_object(entry.event);
  const std::string digest = envelope_digest(jsonlite::to_json(obj));
  obj[kStatusKey] = jsonlite::Value{to_string(entry.replay_status)};
  obj[kRetryKey] = jsonlite::Value{std::uint64_t{entry.retry_count}};
  obj[kLastRetryKey] = entry.last_retry_at ? jsonlite::Value{*entry.last_retry_at}
                                           : jsonlite::Value{nullptr};
  obj[kDigestKey] = jsonlite::Value{digest};
  return jsonlite::to_json(obj);
}

std::optional<QueueEntry> parse_entry_line(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object obj = jsonlite::parse(line, &jerr);
  if (jerr) {
    if (error) *error = jerr->message;
    return std::nullopt;
  }

  QueueEntry entry;
  const std::string status = jsonlite::get_string(obj, kStatusKey, "pending");
  entry.replay_status = parse_replay_status(status).value_or(ReplayStatus::pending);
  const unsigned long long retries = jsonlite::get_u64(obj, kRetryKey, 0);
  entry.retry_count = retries > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<uint32_t>(retries);
  if (jsonlite::has_key(obj, kLastRetryKey) && !jsonlite::is_null(obj, kLastRetryKey)) {
    entry.last_retry_at = jsonlite::get_string(obj, kLastRetryKey);
  }
  const bool has_digest = jsonlite::has_key(obj, kDigestKey);
  const std::string digest = jsonlite::get_string(obj, kDigestKey);

  obj.erase(kStatusKey);
  obj.erase(kRetryKey);
  obj.erase(kLastRetryKey);
  obj.erase(kDigestKey);

  if (has_digest) {
    if (!is_hex_digest(digest) || envelope_digest(jsonlite::to_json(obj)) != digest) {
      if (error) *error = "digest mismatch";
      return std::nullopt;
    }
  }

  std::string env_err;
  auto env = envelope_from_object(obj, &env_err);
  if (!env) {
    if (error) *error = env_err;
    return std::nullopt;
  }
  entry.event = std::move(*env);
  return entry;
}

EventQueueStore::EventQueueStore(std::filesystem::path home)
    : queues_dir_(std::move(home) / "queues") {}

std::filesystem::path EventQueueStore::queue_path(const std::string& stream_id) const {
  return queues_dir_ / (stream_id + ".jsonl");
}

std::filesystem::path EventQueueStore::lock_path(const std::string& stream_id) const {
  return queues_dir_ / (stream_id + ".lock");
}

OpError EventQueueStore::check_owner(const std::string& stream_id,
                                     const EventEnvelope& envelope) const {
  if (!is_valid_stream_id(stream_id)) {
    return OpError{ErrorCode::invalid_input, "invalid stream id: " + stream_id};
  }
  if (envelope.aggregate_id != aggregate_for_mission(stream_id)) {
    return OpError{ErrorCode::invalid_input,
                   "envelope aggregate " + envelope.aggregate_id + " does not belong to " + stream_id};
  }
  return {};
}

OpError EventQueueStore::write_entry(const std::string& stream_id, const EventEnvelope& envelope,
                                     ReplayStatus status) {
  QueueEntry entry;
  entry.event = envelope;
  entry.replay_status = status;
  std::string line = entry_to_line(entry);

  // Terminate a truncated trailing line left by a crash so the new entry
  // starts on its own line.
  const auto path = queue_path(stream_id);
  const auto tail = last_byte(path);
  if (tail && *tail != '\n') line.insert(line.begin(), '\n');

  std::string err;
  if (!append_line_durable(path, line, &err)) {
    return OpError{ErrorCode::io_failure, err};
  }
  global_sync_stats().appends.fetch_add(1, std::memory_order_relaxed);
  return {};
}

OpError EventQueueStore::append(const std::string& stream_id, const EventEnvelope& envelope,
                                ReplayStatus status) {
  if (OpError e = check_owner(stream_id, envelope)) return e;

  FileLock lock(lock_path(stream_id));
  if (!lock.locked()) return OpError{ErrorCode::io_failure, lock.error()};
  return write_entry(stream_id, envelope, status);
}

std::optional<EventEnvelope> EventQueueStore::append_stamped(const std::string& stream_id,
                                                             const EnvelopeStamper& stamper,
                                                             OpError* error, ReplayStatus status) {
  auto fail = [error](OpError e) -> std::optional<EventEnvelope> {
    if (error) *error = std::move(e);
    return std::nullopt;
  };
  if (!is_valid_stream_id(stream_id)) {
    return fail({ErrorCode::invalid_input, "invalid stream id: " + stream_id});
  }

  FileLock lock(lock_path(stream_id));
  if (!lock.locked()) return fail({ErrorCode::io_failure, lock.error()});

  OpError err;
  auto env = stamper(&err);
  if (!env) {
    if (!err) err = {ErrorCode::invalid_input, "no envelope to append"};
    return fail(std::move(err));
  }
  if (OpError e = check_owner(stream_id, *env)) return fail(std::move(e));
  if (OpError e = write_entry(stream_id, *env, status)) return fail(std::move(e));
  return env;
}

std::vector<QueueEntry> EventQueueStore::read_all(const std::string& stream_id) const {
  if (!is_valid_stream_id(stream_id)) return {};
  return load_entries(queue_path(stream_id), stream_id);
}

std::vector<QueueEntry> EventQueueStore::read_pending(const std::string& stream_id) const {
  std::vector<QueueEntry> out;
  for (auto& e : read_all(stream_id)) {
    if (e.replay_status == ReplayStatus::pending) out.push_back(std::move(e));
  }
  return out;
}

std::optional<QueueEntry> EventQueueStore::find(const std::string& stream_id,
                                                const std::string& event_id) const {
  for (auto& e : read_all(stream_id)) {
    if (e.event.event_id == event_id) return std::move(e);
  }
  return std::nullopt;
}

OpError EventQueueStore::update_status(const std::string& stream_id,
                                       const std::map<std::string, StatusUpdate>& updates) {
  if (updates.empty()) return {};
  if (!is_valid_stream_id(stream_id)) {
    return OpError{ErrorCode::invalid_input, "invalid stream id: " + stream_id};
  }
  FileLock lock(lock_path(stream_id));
  if (!lock.locked()) return OpError{ErrorCode::io_failure, lock.error()};

  const std::string aggregate = aggregate_for_mission(stream_id);
  return rewrite_locked(queue_path(stream_id), stream_id,
                        [&](QueueEntry& e) {
                          if (e.event.aggregate_id != aggregate) return false;
                          auto it = updates.find(e.event.event_id);
                          if (it == updates.end()) return false;
                          e.replay_status = it->second.status;
                          e.retry_count = it->second.retry_count;
                          e.last_retry_at = it->second.last_retry_at;
                          return true;
                        },
                        nullptr);
}

QueueSummary EventQueueStore::summary(const std::string& stream_id) const {
  QueueSummary s;
  for (const auto& e : read_all(stream_id)) {
    ++s.total;
    switch (e.replay_status) {
      case ReplayStatus::pending:   ++s.pending; break;
      case ReplayStatus::delivered: ++s.delivered; break;
      case ReplayStatus::failed:
        ++s.failed;
        s.failed_event_ids.push_back(e.event.event_id);
        break;
    }
  }
  return s;
}

std::optional<uint64_t> EventQueueStore::requeue_failed(const std::string& stream_id,
                                                        OpError* error) {
  if (!is_valid_stream_id(stream_id)) {
    if (error) *error = OpError{ErrorCode::invalid_input, "invalid stream id: " + stream_id};
    return std::nullopt;
  }
  FileLock lock(lock_path(stream_id));
  if (!lock.locked()) {
    if (error) *error = OpError{ErrorCode::io_failure, lock.error()};
    return std::nullopt;
  }
  const std::string aggregate = aggregate_for_mission(stream_id);
  uint64_t moved = 0;
  OpError err = rewrite_locked(queue_path(stream_id), stream_id,
                               [&](QueueEntry& e) {
                                 if (e.event.aggregate_id != aggregate) return false;
                                 if (e.replay_status != ReplayStatus::failed) return false;
                                 e.replay_status = ReplayStatus::pending;
                                 return true;
                               },
                               &moved);
  if (err) {
    if (error) *error = err;
    return std::nullopt;
  }
  return moved;
}

}  // namespace concord
