#include "concord/version.hpp"

#include "concord/jsonlite.hpp"

namespace concord {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = ENGINE_SEMVER;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + " " + __TIME__;
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["queue_format"] = Value{std::uint64_t{m.queue_format}};
  o["clock_format"] = Value{std::uint64_t{m.clock_format}};
  o["session_format"] = Value{std::uint64_t{m.session_format}};
  o["ingest_protocol"] = Value{std::uint64_t{m.ingest_protocol}};
  o["hash_algorithm"] = Value{std::uint64_t{m.hash_algorithm}};
  o["engine_semver"] = Value{m.engine_semver};
  o["hash_primitive"] = Value{m.hash_primitive};
  o["build_timestamp"] = Value{m.build_timestamp};
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace concord
