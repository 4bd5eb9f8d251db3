#include "concord/hash.hpp"

// DESIGN INVARIANTS:
//   1. BLAKE3 is the only hash primitive.
//   2. Domain separation: the "evt:" (queue line digest) and "batch:"
//      (Idempotency-Key) prefixes keep the two uses apart even over identical
//      bytes. Both prefixes are part of the on-disk and wire contract.
//   3. Changing either prefix, or the algorithm, requires a bump of
//      HASH_ALGORITHM_VERSION in version.hpp.

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace concord {
namespace {

// Incremental hasher producing 64-char lowercase hex.
class Digest {
 public:
  Digest() { blake3_hasher_init(&hasher_); }

  Digest& update(std::string_view bytes) {
    blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
    return *this;
  }

  std::string hex() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::array<uint8_t, BLAKE3_OUT_LEN> raw{};
    blake3_hasher_finalize(&hasher_, raw.data(), raw.size());
    std::string out;
    out.reserve(raw.size() * 2);
    for (uint8_t b : raw) {
      out += kHex[b >> 4];
      out += kHex[b & 0x0f];
    }
    return out;
  }

 private:
  blake3_hasher hasher_;
};

}  // namespace

std::string blake3_hex(std::string_view payload) {
  return Digest().update(payload).hex();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Digest().update(domain).update(payload).hex();
}

std::string envelope_digest(std::string_view canonical_envelope_json) {
  return hash_domain("evt:", canonical_envelope_json);
}

// Ids are newline-terminated so ["AB","C"] and ["A","BC"] never share a key.
std::string batch_idempotency_key(const std::vector<std::string>& event_ids) {
  Digest d;
  d.update("batch:");
  for (const auto& id : event_ids) d.update(id).update("\n");
  return d.hex();
}

bool is_hex_digest(std::string_view digest) {
  if (digest.size() != BLAKE3_OUT_LEN * 2) return false;
  for (char c : digest) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) return false;
  }
  return true;
}

}  // namespace concord
