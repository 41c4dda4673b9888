#include "lindos/validate.hpp"

#include "lindos/text.hpp"

namespace lindos {

ValidationOutcome validate(const char* message) {
  if (!message) return ValidationOutcome::invalid(ErrorCode::null_input);
  return validate_bytes(std::string_view(message));
}

ValidationOutcome validate_bytes(std::string_view message) {
  if (!is_valid_utf8(message)) return ValidationOutcome::invalid(ErrorCode::invalid_encoding);
  if (trim_whitespace(message).empty()) return ValidationOutcome::invalid(ErrorCode::empty_message);
  return ValidationOutcome::valid();
}

}  // namespace lindos
