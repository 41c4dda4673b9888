#include "lindos/engine.hpp"

#include <cstring>
#include <exception>
#include <mutex>
#include <string>

#include "lindos/debug.hpp"
#include "lindos/hash.hpp"
#include "lindos/observability.hpp"
#include "lindos/text.hpp"
#include "lindos/validate.hpp"

namespace lindos {

namespace {

std::mutex g_engine_mu;
std::shared_ptr<const Engine> g_engine;
EngineConfig g_config;
std::once_flag g_init_once;

void init_from_env() {
  std::call_once(g_init_once, [] {
    const EngineConfig config = config_from_env();
    auto engine = std::make_shared<const Engine>(
        std::make_shared<const EchoResponder>(config.max_message_bytes));
    {
      std::lock_guard<std::mutex> lk(g_engine_mu);
      if (!g_engine) g_engine = std::move(engine);
      g_config = config;
    }
    set_diagnostic_log_path(config.event_log_path);
    if (config.debug) set_debug_enabled(true);
  });
}

DiagnosticEvent make_event(const char* operation, const char* message, bool debug) {
  DiagnosticEvent ev;
  ev.operation = operation;
  if (message) {
    ev.input_bytes = std::strlen(message);
    if (debug) ev.correlation_id = message_fingerprint(message);
  }
  return ev;
}

}  // namespace

Engine::Engine(std::shared_ptr<const IResponder> responder)
    : responder_(responder ? std::move(responder)
                           : std::make_shared<const EchoResponder>()) {}

ValidationOutcome Engine::validate(const char* message) const {
  const bool debug = debug_enabled();
  DiagnosticEvent ev = make_event("validate", message, debug);

  ValidationOutcome outcome;
  {
    ScopeTimer timer(ev.duration_ns);
    outcome = lindos::validate(message);
  }

  ev.ok = outcome.ok();
  ev.error_code = error_code_of(outcome.error);
  emit_diagnostic(ev, debug);
  return outcome;
}

ProcessResult Engine::process(const char* message) const {
  const bool debug = debug_enabled();
  DiagnosticEvent ev = make_event("process", message, debug);
  ev.responder_id = responder_->responder_id();

  ProcessResult result;
  {
    ScopeTimer timer(ev.duration_ns);
    result = run(message);
  }

  ev.ok = result.ok;
  ev.error_code = error_code_of(result.error);
  ev.detail = result.diagnostic;
  emit_diagnostic(ev, debug);
  return result;
}

ProcessResult Engine::run(const char* message) const {
  // Same rules, same order as the consumer pre-check.
  const ValidationOutcome v = lindos::validate(message);
  if (!v.ok()) return ProcessResult::failure(v.error);

  std::string error;
  std::string reply;
  try {
    reply = responder_->respond(message, &error);
  } catch (const std::exception& e) {
    return ProcessResult::failure(ErrorCode::processing_failure,
                                  std::string("responder threw: ") + e.what());
  } catch (...) {
    return ProcessResult::failure(ErrorCode::processing_failure,
                                  "responder threw a non-standard exception");
  }

  if (reply.empty()) {
    return ProcessResult::failure(ErrorCode::processing_failure,
                                  error.empty() ? "responder returned no reply" : error);
  }
  // The reply crosses the boundary as a C string; it must survive that intact.
  if (reply.find('\0') != std::string::npos) {
    return ProcessResult::failure(ErrorCode::processing_failure, "reply contains NUL byte");
  }
  if (!is_valid_utf8(reply)) {
    return ProcessResult::failure(ErrorCode::processing_failure, "reply is not valid UTF-8");
  }
  return ProcessResult::success(std::move(reply));
}

std::shared_ptr<const Engine> global_engine() {
  init_from_env();
  std::lock_guard<std::mutex> lk(g_engine_mu);
  return g_engine;
}

void install_engine(std::shared_ptr<const Engine> engine) {
  init_from_env();
  if (!engine) return;
  std::lock_guard<std::mutex> lk(g_engine_mu);
  g_engine = std::move(engine);
}

void apply_config(const EngineConfig& config) {
  init_from_env();
  auto engine = std::make_shared<const Engine>(
      std::make_shared<const EchoResponder>(config.max_message_bytes));
  {
    std::lock_guard<std::mutex> lk(g_engine_mu);
    g_engine = std::move(engine);
    g_config = config;
  }
  set_diagnostic_log_path(config.event_log_path);
  set_debug_enabled(config.debug);
}

EngineConfig current_config() {
  init_from_env();
  EngineConfig config;
  {
    std::lock_guard<std::mutex> lk(g_engine_mu);
    config = g_config;
  }
  // lindos_set_debug toggles the flag without touching g_config.
  config.debug = debug_enabled();
  return config;
}

}  // namespace lindos
