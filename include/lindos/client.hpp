#pragma once

// lindos/client.hpp - Consumer-side wrapper over the C ABI.
//
// This is the code a front-end links instead of calling c_api.h directly. It
// talks to the engine only through the C functions, exactly as a foreign
// runtime would, so the ownership protocol is exercised end to end.
//
// SCOPED ACQUISITION:
//   ScopedResult and ScopedString take ownership of a boundary pointer on
//   construction and release it in their destructor. They are move-only; a
//   moved-from instance owns nothing. Copying the payload out (payload(),
//   str()) may throw std::bad_alloc; the destructor still releases.

#include <atomic>
#include <cstdint>
#include <future>
#include <string>
#include <string_view>

#include "lindos/c_api.h"
#include "lindos/types.hpp"

namespace lindos {

class ScopedString {
 public:
  ScopedString() = default;
  explicit ScopedString(char* s) : s_(s) {}
  ~ScopedString() { reset(); }

  ScopedString(ScopedString&& other) noexcept;
  ScopedString& operator=(ScopedString&& other) noexcept;
  ScopedString(const ScopedString&) = delete;
  ScopedString& operator=(const ScopedString&) = delete;

  const char* get() const { return s_; }
  explicit operator bool() const { return s_ != nullptr; }
  std::string str() const { return s_ ? std::string(s_) : std::string(); }

  void reset();

 private:
  char* s_{nullptr};
};

class ScopedResult {
 public:
  explicit ScopedResult(lindos_result_t r) : r_(r), owned_(true) {}
  ~ScopedResult() { reset(); }

  ScopedResult(ScopedResult&& other) noexcept;
  ScopedResult& operator=(ScopedResult&& other) noexcept;
  ScopedResult(const ScopedResult&) = delete;
  ScopedResult& operator=(const ScopedResult&) = delete;

  bool success() const { return r_.success; }
  int32_t error_code() const { return r_.error_code; }
  ErrorKind error() const { return error_kind_from_code(r_.error_code); }
  const char* data() const { return r_.data; }
  std::string payload() const { return r_.data ? std::string(r_.data) : std::string(); }

  // Releases the envelope now. Later calls and the destructor do nothing.
  void reset();

 private:
  lindos_result_t r_;
  bool owned_{false};
};

// Unwrapped, caller-owned form of an envelope.
struct Reply {
  bool ok{false};
  std::string text;
  ErrorKind error{ErrorCode::none};
  std::string diagnostic;

  static Reply success(std::string text);
  static Reply failure(ErrorKind kind, std::string diagnostic = "");
};

class Client {
 public:
  // Local structural check with the engine's own rules. Does not call the
  // engine and allocates no boundary memory.
  ValidationOutcome precheck(const std::string& text) const;

  // Engine-side check through lindos_validate_message().
  ValidationOutcome validate(const std::string& text) const;

  // Blocking call through lindos_process_message(). Never throws: allocation
  // failures while unwrapping become processing_failure replies.
  Reply process(const std::string& text) const;

  // Runs process() on a new thread. The Client must outlive the future.
  std::future<Reply> process_async(std::string text) const;

  // Text from lindos_error_message(); falls back to user_message() if the
  // engine could not allocate it.
  std::string error_message(const ErrorKind& kind) const;

  void set_debug(bool enabled) const;

  // Number of process() calls that reached the engine.
  uint64_t engine_calls() const { return engine_calls_.load(std::memory_order_relaxed); }

 private:
  mutable std::atomic<uint64_t> engine_calls_{0};
};

}  // namespace lindos
