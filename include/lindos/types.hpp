#pragma once

// lindos/types.hpp - Core data structures shared by the engine and its callers.
//
// ERROR TAXONOMY:
//   ErrorCode is the closed set of failure kinds with stable integer codes.
//   The codes are part of the C ABI (see c_api.h) and must never be renumbered.
//   Codes the build does not know about are carried as UnknownError{n} so that
//   an older consumer talking to a newer engine (or the reverse) round-trips
//   them without loss.
//
//     0  none                success sentinel
//     1  null_input          caller passed no message reference at all
//     2  invalid_encoding    message bytes are not valid UTF-8
//     3  empty_message       message is empty or whitespace only
//     4  processing_failure  engine accepted the message but produced no reply
//     n  unknown(n)          any other value, including negatives
//
// MEMORY OWNERSHIP:
//   All types here are value types. ProcessResult owns its strings; it is the
//   C++-side form of the envelope and never holds boundary-owned pointers.
//   The boundary-owned form is lindos_result_t (c_api.h).
//
// EXTENSION_POINT: taxonomy_growth
//   Adding a kind means appending a new code to ErrorCode, to_string(),
//   user_message() and the table above. Existing numbers never move.

#include <cstdint>
#include <string>
#include <variant>

namespace lindos {

enum class ErrorCode : int32_t {
  none = 0,
  null_input = 1,
  invalid_encoding = 2,
  empty_message = 3,
  processing_failure = 4,
};

// Open case for codes outside the known table.
struct UnknownError {
  int32_t code{0};
  bool operator==(const UnknownError&) const = default;
};

using ErrorKind = std::variant<ErrorCode, UnknownError>;

// Lossless mapping between wire codes and kinds.
ErrorKind error_kind_from_code(int32_t code);
int32_t error_code_of(const ErrorKind& kind);

bool is_none(const ErrorKind& kind);
bool is_kind(const ErrorKind& kind, ErrorCode code);

// Stable snake_case name, e.g. "empty_message" or "unknown(9999)".
std::string to_string(ErrorCode code);
std::string to_string(const ErrorKind& kind);

// Short, non-technical text suitable for display. Never empty.
std::string user_message(const ErrorKind& kind);

// ---------------------------------------------------------------------------
// ValidationOutcome - Valid or Invalid(kind). Pure function of a message.
// ---------------------------------------------------------------------------
struct ValidationOutcome {
  ErrorKind error{ErrorCode::none};

  bool ok() const { return is_none(error); }
  static ValidationOutcome valid() { return {}; }
  static ValidationOutcome invalid(ErrorCode code) { return {ErrorKind{code}}; }
};

// ---------------------------------------------------------------------------
// ProcessResult - C++ form of Success(payload) / Failure(kind, diagnostic).
// ---------------------------------------------------------------------------
// Invariants:
//   ok == true   -> error is none, payload non-empty, diagnostic empty.
//   ok == false  -> error is not none, payload empty. diagnostic is only set
//                   for processing_failure and is meant for logs, never parsed.
struct ProcessResult {
  bool ok{false};
  ErrorKind error{ErrorCode::none};
  std::string payload;
  std::string diagnostic;

  static ProcessResult success(std::string payload);
  static ProcessResult failure(ErrorKind kind, std::string diagnostic = "");
};

}  // namespace lindos
