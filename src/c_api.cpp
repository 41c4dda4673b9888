#include "lindos/c_api.h"

// C ABI implementation.
//
// Wraps engine.hpp behind a pure-C boundary. Invariants:
//   - No C++ types cross the boundary.
//   - Every output pointer comes from boundary_heap() and goes back through it.
//   - No exception escapes: each entry point converts it into a failure
//     envelope, an error code or NULL.

#include <exception>
#include <string>

#include "lindos/boundary_heap.hpp"
#include "lindos/config.hpp"
#include "lindos/debug.hpp"
#include "lindos/engine.hpp"
#include "lindos/observability.hpp"
#include "lindos/types.hpp"
#include "lindos/validate.hpp"

namespace {

lindos_result_t make_failure(int32_t code) {
  lindos_result_t r;
  r.success = false;
  r.error_code = code;
  r.data = nullptr;
  return r;
}

lindos_result_t to_envelope(const lindos::ProcessResult& result) {
  lindos_result_t r = make_failure(lindos::error_code_of(result.error));
  if (result.ok) {
    r.data = lindos::boundary_heap().allocate_string(result.payload);
    // A success envelope without a payload is not representable.
    if (!r.data) return make_failure(LINDOS_ERROR_PROCESSING_FAILURE);
    r.success = true;
    r.error_code = LINDOS_ERROR_NONE;
    return r;
  }
  if (lindos::is_kind(result.error, lindos::ErrorCode::processing_failure) &&
      !result.diagnostic.empty()) {
    r.data = lindos::boundary_heap().allocate_string(result.diagnostic);
  }
  return r;
}

void log_boundary_error(const char* entry, const char* what) {
  if (!lindos::debug_enabled()) return;
  lindos::write_diagnostic_line(std::string("[LINDOS DEBUG] ") + entry + " failed: " + what);
}

}  // namespace

extern "C" {

uint32_t lindos_abi_version(void) {
  return LINDOS_ABI_VERSION;
}

void lindos_set_debug(bool enabled) {
  try {
    // Apply environment defaults first so an explicit call always wins.
    lindos::global_engine();
  } catch (const std::exception& e) {
    log_boundary_error("lindos_set_debug", e.what());
  }
  lindos::set_debug_enabled(enabled);
}

bool lindos_debug_enabled(void) {
  return lindos::debug_enabled();
}

int32_t lindos_validate_message(const char* message) {
  try {
    const auto outcome = lindos::global_engine()->validate(message);
    return lindos::error_code_of(outcome.error);
  } catch (const std::exception& e) {
    log_boundary_error("lindos_validate_message", e.what());
  }
  // Diagnostics failed (allocation); the verdict itself allocates nothing.
  return lindos::error_code_of(lindos::validate(message).error);
}

lindos_result_t lindos_process_message(const char* message) {
  try {
    return to_envelope(lindos::global_engine()->process(message));
  } catch (const std::exception& e) {
    log_boundary_error("lindos_process_message", e.what());
  }
  return make_failure(LINDOS_ERROR_PROCESSING_FAILURE);
}

void lindos_release_result(lindos_result_t result) {
  lindos::boundary_heap().release(result.data);
}

char* lindos_error_message(int32_t code) {
  try {
    const std::string text = lindos::user_message(lindos::error_kind_from_code(code));
    return lindos::boundary_heap().allocate_string(text);
  } catch (const std::exception& e) {
    log_boundary_error("lindos_error_message", e.what());
    return nullptr;
  }
}

void lindos_release_string(char* s) {
  lindos::boundary_heap().release(s);
}

char* lindos_process_message_legacy(const char* message) {
  try {
    const auto result = lindos::global_engine()->process(message);
    if (result.ok) return lindos::boundary_heap().allocate_string(result.payload);
    return lindos::boundary_heap().allocate_string(lindos::user_message(result.error));
  } catch (const std::exception& e) {
    log_boundary_error("lindos_process_message_legacy", e.what());
    return nullptr;
  }
}

int32_t lindos_configure(const char* config_json) {
  if (!config_json) return LINDOS_CONFIG_INVALID;
  try {
    const std::string json(config_json);
    const auto check = lindos::validate_config(json);
    if (!check.ok) {
      for (const auto& err : check.errors) {
        log_boundary_error("lindos_configure", err.c_str());
      }
      return LINDOS_CONFIG_INVALID;
    }
    lindos::apply_config(lindos::config_from_json(json, lindos::current_config()));
    return LINDOS_CONFIG_OK;
  } catch (const std::exception& e) {
    log_boundary_error("lindos_configure", e.what());
    return LINDOS_CONFIG_INVALID;
  }
}

char* lindos_stats(void) {
  try {
    return lindos::boundary_heap().allocate_string(lindos::global_engine_stats().to_json());
  } catch (const std::exception& e) {
    log_boundary_error("lindos_stats", e.what());
    return nullptr;
  }
}

}  // extern "C"
