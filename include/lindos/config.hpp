#pragma once

// lindos/config.hpp - Engine configuration.
//
// Sources, later overrides earlier:
//   1. Compiled defaults (below).
//   2. Environment: LINDOS_DEBUG=1, LINDOS_EVENT_LOG=<path>,
//      LINDOS_MAX_MESSAGE_BYTES=<n>, LINDOS_WORKER_THREADS=<n>.
//   3. A flat JSON object passed to lindos_configure() or `lindos_chat --config`.
//      Keys: "max_message_bytes", "event_log_path", "debug", "worker_threads".
//
// Parsing never throws. validate_config() reports every problem it finds; a
// config with errors is rejected as a whole and the running engine is untouched.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lindos {

struct EngineConfig {
  std::size_t max_message_bytes{1000};
  std::string event_log_path;   // empty = stderr
  bool        debug{false};
  uint32_t    worker_threads{2};
};

constexpr std::size_t kMaxMessageBytesLimit = 1u << 20;
constexpr uint32_t    kMaxWorkerThreads = 64;

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);

// Overlay the keys present in config_json onto base. Call validate_config first;
// malformed values are ignored here.
EngineConfig config_from_json(const std::string& config_json, const EngineConfig& base = {});

EngineConfig config_from_env(const EngineConfig& base = {});

std::string config_to_json(const EngineConfig& config);

}  // namespace lindos
