#include "concord/ulid.hpp"

#include "concord/types.hpp"

namespace concord {

namespace {

constexpr char kCrockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr uint64_t kMaxTimestamp = (1ull << 48) - 1;

int decode_char(char c) {
  if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  for (int i = 0; i < 32; ++i) {
    if (kCrockford[i] == c) return i;
  }
  return -1;
}

std::string encode(uint64_t ms, uint16_t hi, uint64_t lo) {
  std::string out(26, '0');
  for (int i = 9; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kCrockford[ms & 31];
    ms >>= 5;
  }
  // Character 10 + j holds bits [b, b+5) of the 80-bit value, b = (15 - j) * 5.
  for (int j = 0; j < 16; ++j) {
    const int b = (15 - j) * 5;
    uint64_t v;
    if (b >= 64) {
      v = static_cast<uint64_t>(hi) >> (b - 64);
    } else if (b + 5 <= 64) {
      v = lo >> b;
    } else {
      v = (lo >> b) | (static_cast<uint64_t>(hi) << (64 - b));
    }
    out[static_cast<size_t>(10 + j)] = kCrockford[v & 31];
  }
  return out;
}

}  // namespace

UlidGenerator::UlidGenerator() : UlidGenerator(MsClock(now_unix_ms)) {}

UlidGenerator::UlidGenerator(MsClock clock)
    : clock_(std::move(clock)), rng_(std::random_device{}()) {}

std::string UlidGenerator::next() {
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t ms = clock_() & kMaxTimestamp;

  if (has_last_ && ms <= last_ms_) {
    ms = last_ms_;
    // 80-bit increment; on overflow borrow the next millisecond.
    if (++last_lo_ == 0 && ++last_hi_ == 0) {
      ms = (last_ms_ + 1) & kMaxTimestamp;
    }
  } else {
    last_lo_ = rng_();
    last_hi_ = static_cast<uint16_t>(rng_() & 0xFFFF);
  }
  last_ms_ = ms;
  has_last_ = true;
  return encode(ms, last_hi_, last_lo_);
}

std::string generate_id() {
  static UlidGenerator generator;
  return generator.next();
}

bool is_valid_id(const std::string& id) {
  if (id.size() != 26) return false;
  if (id[0] < '0' || id[0] > '7') return false;
  for (char c : id) {
    if (decode_char(c) < 0) return false;
  }
  return true;
}

std::optional<uint64_t> id_timestamp_ms(const std::string& id) {
  if (!is_valid_id(id)) return std::nullopt;
  uint64_t ms = 0;
  for (size_t i = 0; i < 10; ++i) {
    ms = (ms << 5) | static_cast<uint64_t>(decode_char(id[i]));
  }
  return ms;
}

}  // namespace concord
