#include "lindos/types.hpp"

#include <utility>

namespace lindos {

ErrorKind error_kind_from_code(int32_t code) {
  switch (code) {
    case 0: return ErrorCode::none;
    case 1: return ErrorCode::null_input;
    case 2: return ErrorCode::invalid_encoding;
    case 3: return ErrorCode::empty_message;
    case 4: return ErrorCode::processing_failure;
  }
  return UnknownError{code};
}

int32_t error_code_of(const ErrorKind& kind) {
  if (const auto* known = std::get_if<ErrorCode>(&kind)) {
    return static_cast<int32_t>(*known);
  }
  return std::get<UnknownError>(kind).code;
}

bool is_none(const ErrorKind& kind) {
  return is_kind(kind, ErrorCode::none);
}

bool is_kind(const ErrorKind& kind, ErrorCode code) {
  const auto* known = std::get_if<ErrorCode>(&kind);
  return known && *known == code;
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "none";
    case ErrorCode::null_input: return "null_input";
    case ErrorCode::invalid_encoding: return "invalid_encoding";
    case ErrorCode::empty_message: return "empty_message";
    case ErrorCode::processing_failure: return "processing_failure";
  }
  return "unknown(" + std::to_string(static_cast<int32_t>(code)) + ")";
}

std::string to_string(const ErrorKind& kind) {
  if (const auto* known = std::get_if<ErrorCode>(&kind)) return to_string(*known);
  return "unknown(" + std::to_string(std::get<UnknownError>(kind).code) + ")";
}

std::string user_message(const ErrorKind& kind) {
  if (const auto* known = std::get_if<ErrorCode>(&kind)) {
    switch (*known) {
      case ErrorCode::none: return "No error";
      case ErrorCode::null_input: return "No message provided";
      case ErrorCode::invalid_encoding: return "Message contains invalid characters";
      case ErrorCode::empty_message: return "Message cannot be empty";
      case ErrorCode::processing_failure: return "Failed to process message";
    }
  }
  // Out-of-range enum values land here too; the code keeps them diagnosable.
  return "Unknown error (code: " + std::to_string(error_code_of(kind)) + ")";
}

ProcessResult ProcessResult::success(std::string payload) {
  ProcessResult r;
  r.ok = true;
  r.payload = std::move(payload);
  return r;
}

ProcessResult ProcessResult::failure(ErrorKind kind, std::string diagnostic) {
  ProcessResult r;
  r.ok = false;
  r.error = kind;
  r.diagnostic = std::move(diagnostic);
  return r;
}

}  // namespace lindos
