#pragma once

// lindos/responder.hpp - Response-generation collaborator interface.
//
// The engine treats reply generation as an opaque function respond(text) -> text.
// IResponder is the seam; the engine never looks inside a reply beyond checking
// that it is non-empty.
//
// CONTRACT for implementations:
//   - respond() is only called with text that passed validate().
//   - Return a non-empty reply on success.
//   - On failure return an empty string and, if error is non-null, write a short
//     diagnostic for logs. The diagnostic is never shown to users or parsed.
//   - Throwing is tolerated: the engine converts any exception into a
//     processing_failure envelope.
//   - Must be safe to call concurrently; the engine shares one instance across
//     all callers.
//
// EXTENSION_POINT: model_backends
//   Current: EchoResponder (deterministic) and FunctionResponder (tests, embedders).
//   A model-backed responder plugs in here without touching the envelope protocol.

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace lindos {

class IResponder {
 public:
  virtual ~IResponder() = default;

  virtual std::string respond(std::string_view message, std::string* error) const = 0;

  // Short identifier for diagnostics, e.g. "echo".
  virtual std::string responder_id() const = 0;
};

// Deterministic reply: "You said: <message>". Refuses messages longer than
// max_message_bytes with diagnostic "message too long".
class EchoResponder : public IResponder {
 public:
  static constexpr std::size_t kDefaultMaxMessageBytes = 1000;

  explicit EchoResponder(std::size_t max_message_bytes = kDefaultMaxMessageBytes)
      : max_message_bytes_(max_message_bytes) {}

  std::string respond(std::string_view message, std::string* error) const override;
  std::string responder_id() const override { return "echo"; }

  std::size_t max_message_bytes() const { return max_message_bytes_; }

 private:
  std::size_t max_message_bytes_;
};

// Adapts a callable with the same contract as IResponder::respond.
class FunctionResponder : public IResponder {
 public:
  using Fn = std::function<std::string(std::string_view, std::string*)>;

  explicit FunctionResponder(Fn fn, std::string id = "function")
      : fn_(std::move(fn)), id_(std::move(id)) {}

  std::string respond(std::string_view message, std::string* error) const override {
    return fn_(message, error);
  }
  std::string responder_id() const override { return id_; }

 private:
  Fn fn_;
  std::string id_;
};

}  // namespace lindos
