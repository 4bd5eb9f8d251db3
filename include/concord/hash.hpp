#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace concord {

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing for different contexts.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Integrity digest stored beside every queue line ("evt:" domain).
// Input is the canonical envelope JSON, which never changes after creation,
// so status rewrites never invalidate the digest.
std::string envelope_digest(std::string_view canonical_envelope_json);

// Idempotency key for one ingestion batch ("batch:" domain over the event ids
// in submission order). A retried batch carries the same key.
std::string batch_idempotency_key(const std::vector<std::string>& event_ids);

// Hex validation for stored digests.
bool is_hex_digest(std::string_view digest);

}  // namespace concord
