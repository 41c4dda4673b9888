#include "lindos/config.hpp"

#include <cstdlib>
#include <regex>
#include <set>

#include "lindos/jsonlite.hpp"

namespace lindos {

namespace {

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys{
      "max_message_bytes", "event_log_path", "debug", "worker_threads"};
  return keys;
}

bool parse_env_u64(const char* name, unsigned long long* out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (!end || *end != '\0') return false;
  *out = v;
  return true;
}

}  // namespace

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;

  const auto first = config_json.find_first_not_of(" \t\r\n");
  const auto last = config_json.find_last_not_of(" \t\r\n");
  if (first == std::string::npos || config_json[first] != '{' || config_json[last] != '}') {
    r.errors.push_back("config must be a JSON object");
    return r;
  }

  std::regex key_re("\\\"([A-Za-z0-9_]+)\\\"\\s*:");
  for (auto it = std::sregex_iterator(config_json.begin(), config_json.end(), key_re);
       it != std::sregex_iterator(); ++it) {
    const std::string key = (*it)[1].str();
    if (!known_keys().count(key)) r.warnings.push_back("unknown key ignored: " + key);
  }

  if (jsonlite::has_key(config_json, "max_message_bytes")) {
    if (!jsonlite::is_u64(config_json, "max_message_bytes")) {
      r.errors.push_back("max_message_bytes must be a non-negative integer");
    } else {
      const auto v = jsonlite::get_u64(config_json, "max_message_bytes");
      if (v == 0 || v > kMaxMessageBytesLimit) {
        r.errors.push_back("max_message_bytes must be in [1, " +
                           std::to_string(kMaxMessageBytesLimit) + "]");
      }
    }
  }

  if (jsonlite::has_key(config_json, "worker_threads")) {
    if (!jsonlite::is_u64(config_json, "worker_threads")) {
      r.errors.push_back("worker_threads must be a non-negative integer");
    } else {
      const auto v = jsonlite::get_u64(config_json, "worker_threads");
      if (v == 0 || v > kMaxWorkerThreads) {
        r.errors.push_back("worker_threads must be in [1, " + std::to_string(kMaxWorkerThreads) + "]");
      }
    }
  }

  if (jsonlite::has_key(config_json, "debug") && !jsonlite::is_bool(config_json, "debug")) {
    r.errors.push_back("debug must be true or false");
  }

  if (jsonlite::has_key(config_json, "event_log_path") &&
      jsonlite::get_string(config_json, "event_log_path", "\x01") == "\x01") {
    r.errors.push_back("event_log_path must be a string");
  }

  r.ok = r.errors.empty();
  return r;
}

EngineConfig config_from_json(const std::string& config_json, const EngineConfig& base) {
  EngineConfig c = base;
  if (jsonlite::is_u64(config_json, "max_message_bytes")) {
    c.max_message_bytes = static_cast<std::size_t>(jsonlite::get_u64(config_json, "max_message_bytes"));
  }
  if (jsonlite::is_u64(config_json, "worker_threads")) {
    c.worker_threads = static_cast<uint32_t>(jsonlite::get_u64(config_json, "worker_threads"));
  }
  if (jsonlite::is_bool(config_json, "debug")) {
    c.debug = jsonlite::get_bool(config_json, "debug");
  }
  c.event_log_path = jsonlite::get_string(config_json, "event_log_path", c.event_log_path);
  return c;
}

EngineConfig config_from_env(const EngineConfig& base) {
  EngineConfig c = base;

  if (const char* e = std::getenv("LINDOS_DEBUG")) {
    c.debug = std::string(e) == "1" || std::string(e) == "true";
  }
  if (const char* e = std::getenv("LINDOS_EVENT_LOG"); e && e[0]) {
    c.event_log_path = e;
  }

  unsigned long long v = 0;
  if (parse_env_u64("LINDOS_MAX_MESSAGE_BYTES", &v) && v > 0 && v <= kMaxMessageBytesLimit) {
    c.max_message_bytes = static_cast<std::size_t>(v);
  }
  if (parse_env_u64("LINDOS_WORKER_THREADS", &v) && v > 0 && v <= kMaxWorkerThreads) {
    c.worker_threads = static_cast<uint32_t>(v);
  }
  return c;
}

std::string config_to_json(const EngineConfig& config) {
  std::string out = "{\"max_message_bytes\":";
  out += std::to_string(config.max_message_bytes);
  out += ",\"event_log_path\":\"";
  out += jsonlite::escape(config.event_log_path);
  out += "\",\"debug\":";
  out += config.debug ? "true" : "false";
  out += ",\"worker_threads\":";
  out += std::to_string(config.worker_threads);
  out += '}';
  return out;
}

}  // namespace lindos
