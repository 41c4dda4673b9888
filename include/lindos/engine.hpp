#pragma once

// lindos/engine.hpp - Message processing engine.
//
// DESIGN:
//   Engine is immutable after construction: it holds a shared, const responder
//   and nothing else. process() re-runs validate() itself because a caller may
//   have skipped the pre-check; invalid input never reaches the responder.
//
// CONCURRENCY:
//   Any number of threads may call validate()/process() on one Engine. The only
//   shared mutable state touched is the debug flag (read once per call) and the
//   diagnostic sink (internally serialized).
//
//   The process-wide engine used by the C ABI is replaced atomically by
//   install_engine()/apply_config(). Each call takes a shared_ptr snapshot, so a
//   call already in flight finishes on the engine it started with.

#include <memory>

#include "lindos/config.hpp"
#include "lindos/responder.hpp"
#include "lindos/types.hpp"

namespace lindos {

class Engine {
 public:
  explicit Engine(std::shared_ptr<const IResponder> responder);

  // Same verdict as lindos::validate(); additionally records a diagnostic.
  ValidationOutcome validate(const char* message) const;

  // Success(reply) with a non-empty, valid UTF-8 reply, or Failure(kind, diag).
  // Never throws for any input; responder exceptions become processing_failure.
  ProcessResult process(const char* message) const;

  const IResponder& responder() const { return *responder_; }

 private:
  ProcessResult run(const char* message) const;

  std::shared_ptr<const IResponder> responder_;
};

// Process-wide engine. First use initializes it from config_from_env().
std::shared_ptr<const Engine> global_engine();
void install_engine(std::shared_ptr<const Engine> engine);

// Install an EchoResponder engine sized by config, set the diagnostic log path
// and the debug flag.
void apply_config(const EngineConfig& config);
EngineConfig current_config();

}  // namespace lindos
