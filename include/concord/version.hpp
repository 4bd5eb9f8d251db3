#pragma once

// concord/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the local queue, the clock file, the
//   session cache and the ingestion wire protocol. Every component that reads
//   or writes a versioned format must check its constant here first.
//
// INVARIANT:
//   All version constants are compile-time. A format change without a bump
//   here is a bug: queue files outlive the binary that wrote them.
//
// EXTENSION_POINT: version_negotiation
//   Current: the ingestion endpoint is assumed to speak INGEST_PROTOCOL_VERSION.
//   Upgrade path: send the version as a request header and let the server
//   answer with the highest version both sides understand.

#include <cstdint>
#include <string>

namespace concord {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.4.0";

// ---------------------------------------------------------------------------
// QUEUE_FORMAT_VERSION
// Tracks the NDJSON line layout of <home>/queues/<stream>.jsonl.
// Version 1 = envelope fields + _replay_status/_retry_count/_last_retry_at.
// Version 2 = current: adds _digest (BLAKE3 of the canonical envelope).
// Readers accept version 1 lines (no _digest) without integrity checking.
// ---------------------------------------------------------------------------
constexpr uint32_t QUEUE_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// CLOCK_FORMAT_VERSION
// Tracks the keyed {node_id: counter} layout of lamport_clock.json.
// ---------------------------------------------------------------------------
constexpr uint32_t CLOCK_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// SESSION_FORMAT_VERSION
// Tracks the layout of <home>/missions/<mission>/session.json.
// ---------------------------------------------------------------------------
constexpr uint32_t SESSION_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// INGEST_PROTOCOL_VERSION
// Tracks the batch request/response contract of the ingestion endpoint.
// Version 1 = {"events":[...]} → {"results":[{event_id,status,reason}]}
//             (the legacy {"accepted":[],"rejected":[]} reply is still read).
// ---------------------------------------------------------------------------
constexpr uint32_t INGEST_PROTOCOL_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars. Used by _digest and the
// batch Idempotency-Key header.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t queue_format{QUEUE_FORMAT_VERSION};
  uint32_t clock_format{CLOCK_FORMAT_VERSION};
  uint32_t session_format{SESSION_FORMAT_VERSION};
  uint32_t ingest_protocol{INGEST_PROTOCOL_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;     // "blake3"
  std::string build_timestamp;    // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace concord
