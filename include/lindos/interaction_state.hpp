#pragma once

// lindos/interaction_state.hpp - Interaction state machine for one chat surface.
//
//   Idle ──begin_validation──▶ Validating ──begin_thinking──▶ Thinking
//    ▲                             │                            │
//    │                        show_error                  settle / show_error
//    │                             ▼                            ▼
//    └──dismiss/clear──────── ErrorShown ◀──────────────── Settled
//
// begin_validation is accepted from Idle, Settled and ErrorShown; reset() from
// any phase. Owned and mutated by the interaction thread only; the observer is
// called synchronously after every accepted transition.

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "lindos/interaction_loop.hpp"
#include "lindos/types.hpp"

namespace lindos {

enum class Phase {
  idle,
  validating,
  thinking,
  settled,
  error_shown,
};

const char* to_string(Phase phase);

// Where a shown error came from. Live validation errors are withdrawn when the
// draft becomes valid again; send errors stay until timeout or clear().
enum class ErrorSource {
  send,
  live_validation,
};

struct InteractionState {
  Phase phase{Phase::idle};
  std::string prompt;          // shown while Idle
  std::string reply;           // Settled text; kept under ErrorShown for restore
  std::optional<ErrorKind> error;
  std::string error_message;
  ErrorSource error_source{ErrorSource::send};
  TimePoint error_expiry{};
  std::string draft;

  bool can_send() const { return phase != Phase::validating && phase != Phase::thinking; }
};

class InteractionStateMachine {
 public:
  using Observer = std::function<void(const InteractionState&)>;

  explicit InteractionStateMachine(std::string prompt = "");

  const InteractionState& state() const { return state_; }
  Phase phase() const { return state_.phase; }

  void set_observer(Observer observer) { observer_ = std::move(observer); }

  bool begin_validation();
  bool begin_thinking();
  bool settle(std::string reply);

  // From Validating/Thinking (send errors) or Idle/Settled/ErrorShown (live
  // validation errors). reply replaces the retained reply when non-empty.
  bool show_error(ErrorKind kind, std::string message, ErrorSource source,
                  TimePoint expiry, std::string reply = "");

  // ErrorShown -> Settled if a reply is retained, else Idle.
  bool dismiss_error();

  // ErrorShown -> Idle.
  bool clear();

  // Any phase -> Idle with prompt. Drops the retained reply and draft.
  void reset(std::string prompt);

  // Draft edits never change the phase and are not reported to the observer.
  void set_draft(std::string draft) { state_.draft = std::move(draft); }

 private:
  void clear_error();
  void notify();

  InteractionState state_;
  Observer observer_;
};

}  // namespace lindos
