#pragma once

// concord/lamport.hpp — Per-node Lamport clock persisted to a keyed file.
//
// File format: {"<node_id>": <counter>, ...} at <home>/events/lamport_clock.json.
// Several nodes may share the file (e.g. a synced home directory); each
// mutation rewrites only this node's key and preserves the others.
//
// DESIGN INVARIANTS:
//   - Values handed out for one node id are strictly increasing, even across
//     processes: every mutation reloads the node's counter from disk while
//     holding an exclusive flock on "<file>.lock", then persists atomically
//     (temp + fsync + rename) before returning.
//   - A missing or corrupt file is treated as an empty clock (counter 0).
//     Corruption is logged, never fatal.
//   - A persistence failure returns nullopt and the in-memory value is not
//     advanced, so no event is ever stamped with an unpersisted value.

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace concord {

class LamportClock {
 public:
  LamportClock(std::string node_id, std::filesystem::path clock_file);

  // Standard location under a concord home directory.
  static std::filesystem::path default_path(const std::filesystem::path& home);

  // Local event: counter + 1.
  std::optional<uint64_t> increment(std::string* error = nullptr);

  // Receipt of a remote stamp: max(local, remote) + 1.
  std::optional<uint64_t> observe(uint64_t remote, std::string* error = nullptr);

  // Last persisted value for this node (0 when none).
  uint64_t current() const;

  const std::string& node_id() const { return node_id_; }

  // All counters in the file. Used by `clock show`.
  std::map<std::string, uint64_t> snapshot() const;

 private:
  std::optional<uint64_t> advance(uint64_t floor, std::string* error);
  std::map<std::string, uint64_t> load() const;

  std::string node_id_;
  std::filesystem::path path_;
  uint64_t cached_{0};
};

}  // namespace concord
