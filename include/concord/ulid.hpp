#pragma once

// concord/ulid.hpp — 26-character time-sortable identifiers.
//
// Layout: 48-bit unix millisecond timestamp followed by 80 random bits,
// encoded as Crockford Base32 (alphabet without I, L, O, U). Ten characters
// of time, sixteen of randomness.
//
// DESIGN INVARIANTS:
//   - Lexicographic order of ids equals generation order within one process.
//     When two ids land in the same millisecond (or the wall clock steps
//     backwards) the previous random component is incremented by one instead
//     of drawing a fresh value.
//   - Ids from different nodes sort by time only approximately. Causal order
//     comes from the Lamport clock, never from ids.

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace concord {

class UlidGenerator {
 public:
  using MsClock = std::function<uint64_t()>;

  UlidGenerator();
  explicit UlidGenerator(MsClock clock);

  std::string next();

 private:
  MsClock clock_;
  std::mutex mu_;
  std::mt19937_64 rng_;
  uint64_t last_ms_{0};
  uint16_t last_hi_{0};   // top 16 of the 80 random bits
  uint64_t last_lo_{0};   // low 64 of the 80 random bits
  bool has_last_{false};
};

// Process-wide generator.
std::string generate_id();

// Length 26, Crockford alphabet (case-insensitive), first char <= '7'.
bool is_valid_id(const std::string& id);

// Millisecond timestamp encoded in a valid id.
std::optional<uint64_t> id_timestamp_ms(const std::string& id);

}  // namespace concord
