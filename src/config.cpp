#include "concord/config.hpp"

#include <cstdlib>
#include <sstream>

#include "concord/file_io.hpp"
#include "concord/jsonlite.hpp"

namespace concord {

namespace {

constexpr uint32_t kMaxBatchSize = 1000;

std::optional<uint32_t> parse_u32(const std::string& s) {
  if (s.empty() || s.size() > 10) return std::nullopt;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  if (v > 0xFFFFFFFFull) return std::nullopt;
  return static_cast<uint32_t>(v);
}

void apply_u32(uint32_t& field, const std::string& name, const std::string& raw,
               std::vector<std::string>& warnings) {
  const auto v = parse_u32(raw);
  if (!v) {
    warnings.push_back("ignoring non-numeric " + name + "=" + raw);
    return;
  }
  field = *v;
}

void apply_file(Config& c, const jsonlite::Object& obj) {
  using namespace jsonlite;
  if (has_key(obj, "api_url")) c.api_url = get_string(obj, "api_url", c.api_url);
  if (has_key(obj, "auth_token")) c.auth_token = get_string(obj, "auth_token", c.auth_token);
  if (has_key(obj, "node_id")) c.node_id = get_string(obj, "node_id", c.node_id);
  if (has_key(obj, "log_path")) c.log_path = get_string(obj, "log_path", c.log_path);
  const auto u32 = [&](const char* key, uint32_t& field) {
    if (!has_key(obj, key)) return;
    const unsigned long long v = get_u64(obj, key, field);
    if (v > 0xFFFFFFFFull) {
      c.warnings.push_back(std::string("config.json: ") + key + " out of range");
      return;
    }
    field = static_cast<uint32_t>(v);
  };
  u32("batch_size", c.batch_size);
  u32("max_retries", c.max_retries);
  u32("http_timeout_ms", c.http_timeout_ms);
  u32("connect_timeout_ms", c.connect_timeout_ms);
  u32("backoff_base_ms", c.backoff_base_ms);
}

}  // namespace

EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* e = std::getenv(name.c_str());
    if (!e || !e[0]) return std::nullopt;
    return std::string(e);
  };
}

Config load_config(const ConfigOverrides& overrides, const EnvLookup& env) {
  Config c;

  if (overrides.home) {
    c.home = *overrides.home;
  } else if (auto h = env("CONCORD_HOME")) {
    c.home = *h;
  } else if (auto h = env("HOME")) {
    c.home = *h + "/.concord";
  } else {
    c.home = ".concord";
  }

  // Layer 3: config file.
  const fs::path file = fs::path(c.home) / "config.json";
  if (auto text = read_file(file)) {
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(*text, &err);
    if (err) {
      c.warnings.push_back("config.json ignored: " + err->message);
    } else {
      apply_file(c, obj);
    }
  }

  // Layer 2: environment.
  if (auto v = env("CONCORD_API_URL")) c.api_url = *v;
  if (auto v = env("CONCORD_AUTH_TOKEN")) c.auth_token = *v;
  if (auto v = env("CONCORD_NODE_ID")) c.node_id = *v;
  if (auto v = env("CONCORD_LOG")) c.log_path = *v;
  if (auto v = env("CONCORD_BATCH_SIZE")) apply_u32(c.batch_size, "CONCORD_BATCH_SIZE", *v, c.warnings);
  if (auto v = env("CONCORD_MAX_RETRIES")) apply_u32(c.max_retries, "CONCORD_MAX_RETRIES", *v, c.warnings);
  if (auto v = env("CONCORD_HTTP_TIMEOUT_MS")) apply_u32(c.http_timeout_ms, "CONCORD_HTTP_TIMEOUT_MS", *v, c.warnings);
  if (auto v = env("CONCORD_CONNECT_TIMEOUT_MS")) apply_u32(c.connect_timeout_ms, "CONCORD_CONNECT_TIMEOUT_MS", *v, c.warnings);
  if (auto v = env("CONCORD_BACKOFF_BASE_MS")) apply_u32(c.backoff_base_ms, "CONCORD_BACKOFF_BASE_MS", *v, c.warnings);

  // Layer 1: flags.
  if (overrides.api_url) c.api_url = *overrides.api_url;
  if (overrides.node_id) c.node_id = *overrides.node_id;
  if (overrides.batch_size) c.batch_size = *overrides.batch_size;

  while (!c.api_url.empty() && c.api_url.back() == '/') c.api_url.pop_back();
  if (c.batch_size == 0 || c.batch_size > kMaxBatchSize) {
    c.warnings.push_back("batch_size " + std::to_string(c.batch_size) + " out of range, using 100");
    c.batch_size = 100;
  }
  if (c.max_retries == 0) c.max_retries = 1;
  return c;
}

std::string config_to_json(const Config& c, bool redact_token) {
  using jsonlite::escape;
  std::ostringstream o;
  std::string token = c.auth_token;
  if (redact_token && !token.empty()) token = "***";
  o << "{"
    << "\"home\":\"" << escape(c.home) << "\""
    << ",\"api_url\":\"" << escape(c.api_url) << "\""
    << ",\"auth_token\":\"" << escape(token) << "\""
    << ",\"node_id\":\"" << escape(c.node_id) << "\""
    << ",\"batch_size\":" << c.batch_size
    << ",\"max_retries\":" << c.max_retries
    << ",\"http_timeout_ms\":" << c.http_timeout_ms
    << ",\"connect_timeout_ms\":" << c.connect_timeout_ms
    << ",\"backoff_base_ms\":" << c.backoff_base_ms
    << ",\"log_path\":\"" << escape(c.log_path) << "\""
    << ",\"warnings\":[";
  for (size_t i = 0; i < c.warnings.size(); ++i) {
    if (i) o << ",";
    o << "\"" << escape(c.warnings[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

CommandArgs split_command_args(const std::vector<std::string>& args) {
  CommandArgs out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i].size() > 2 && args[i].rfind("--", 0) == 0) {
      if (i + 1 >= args.size()) {
        out.error = args[i] + " requires a value";
        return out;
      }
      out.options[args[i]] = args[i + 1];
      ++i;
    } else {
      out.positional.push_back(args[i]);
    }
  }
  return out;
}

}  // namespace concord
