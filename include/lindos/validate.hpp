#pragma once

// lindos/validate.hpp - Structural message validation.
//
// Rules, first match wins:
//   1. no message reference at all          -> null_input
//   2. bytes are not valid UTF-8            -> invalid_encoding
//   3. empty after trim_whitespace()        -> empty_message
//   4. otherwise                            -> valid
//
// Pure and read-only: safe to call concurrently from any number of threads.
// Engine::process() calls the same function as its first step, so a verdict
// obtained here always matches the kind process() would fail with.

#include <string_view>

#include "lindos/types.hpp"

namespace lindos {

// message: null-terminated UTF-8, or nullptr.
ValidationOutcome validate(const char* message);

// For callers that already hold a non-null byte range.
ValidationOutcome validate_bytes(std::string_view message);

}  // namespace lindos
