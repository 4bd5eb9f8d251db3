#pragma once

// concord/config.hpp — Effective engine configuration.
//
// Resolution order (first match wins per field):
//   1. explicit overrides (CLI flags)
//   2. environment (CONCORD_*)
//   3. <home>/config.json
//   4. built-in defaults
//
// `home` itself is resolved from overrides, then $CONCORD_HOME, then
// $HOME/.concord. It is never read from config.json.
//
// The auth token is a secret: config_to_json() redacts it unless asked not to.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace concord {

struct Config {
  std::string home;
  std::string api_url{"http://127.0.0.1:8000"};
  std::string auth_token;
  std::string node_id;            // empty → resolve_node_identity() default
  uint32_t    batch_size{100};
  uint32_t    max_retries{3};
  uint32_t    http_timeout_ms{10000};
  uint32_t    connect_timeout_ms{3000};
  uint32_t    backoff_base_ms{1000};
  std::string log_path;           // empty → stderr

  // Non-fatal problems found while resolving (bad numbers, unreadable file).
  std::vector<std::string> warnings;
};

struct ConfigOverrides {
  std::optional<std::string> home;
  std::optional<std::string> api_url;
  std::optional<std::string> node_id;
  std::optional<uint32_t>    batch_size;
};

// Environment lookup; replaceable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

Config load_config(const ConfigOverrides& overrides = {},
                   const EnvLookup& env = process_env());

std::string config_to_json(const Config& c, bool redact_token = true);

// Command words with the command-local "--name value" options taken out.
// Every command-local option takes a value; a trailing option without one
// sets `error`.
struct CommandArgs {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::string error;
};

CommandArgs split_command_args(const std::vector<std::string>& args);

}  // namespace concord
