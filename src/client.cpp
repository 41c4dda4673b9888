#include "lindos/client.hpp"

#include <exception>
#include <utility>

#include "lindos/validate.hpp"

namespace lindos {

// ---------------------------------------------------------------------------
// ScopedString
// ---------------------------------------------------------------------------

ScopedString::ScopedString(ScopedString&& other) noexcept
    : s_(std::exchange(other.s_, nullptr)) {}

ScopedString& ScopedString::operator=(ScopedString&& other) noexcept {
  if (this != &other) {
    reset();
    s_ = std::exchange(other.s_, nullptr);
  }
  return *this;
}

void ScopedString::reset() {
  if (s_) lindos_release_string(std::exchange(s_, nullptr));
}

// ---------------------------------------------------------------------------
// ScopedResult
// ---------------------------------------------------------------------------

ScopedResult::ScopedResult(ScopedResult&& other) noexcept
    : r_(other.r_), owned_(std::exchange(other.owned_, false)) {}

ScopedResult& ScopedResult::operator=(ScopedResult&& other) noexcept {
  if (this != &other) {
    reset();
    r_ = other.r_;
    owned_ = std::exchange(other.owned_, false);
  }
  return *this;
}

void ScopedResult::reset() {
  if (!owned_) return;
  owned_ = false;
  lindos_release_result(r_);
  r_.data = nullptr;
}

// ---------------------------------------------------------------------------
// Reply
// ---------------------------------------------------------------------------

Reply Reply::success(std::string text) {
  Reply r;
  r.ok = true;
  r.text = std::move(text);
  return r;
}

Reply Reply::failure(ErrorKind kind, std::string diagnostic) {
  Reply r;
  r.error = kind;
  r.diagnostic = std::move(diagnostic);
  return r;
}

// ---------------------------------------------------------------------------
// Client
// ---------------------------------------------------------------------------

ValidationOutcome Client::precheck(const std::string& text) const {
  // c_str(): the engine sees the text up to the first NUL, so must we.
  return lindos::validate(text.c_str());
}

ValidationOutcome Client::validate(const std::string& text) const {
  const int32_t code = lindos_validate_message(text.c_str());
  return ValidationOutcome{error_kind_from_code(code)};
}

Reply Client::process(const std::string& text) const {
  engine_calls_.fetch_add(1, std::memory_order_relaxed);
  try {
    ScopedResult result(lindos_process_message(text.c_str()));
    if (result.success()) return Reply::success(result.payload());
    return Reply::failure(result.error(), result.payload());
  } catch (const std::exception& e) {
    return Reply::failure(ErrorCode::processing_failure, e.what());
  }
}

std::future<Reply> Client::process_async(std::string text) const {
  return std::async(std::launch::async,
                    [this, text = std::move(text)] { return process(text); });
}

std::string Client::error_message(const ErrorKind& kind) const {
  ScopedString msg(lindos_error_message(error_code_of(kind)));
  if (msg) return msg.str();
  return user_message(kind);
}

void Client::set_debug(bool enabled) const {
  lindos_set_debug(enabled);
}

}  // namespace lindos
