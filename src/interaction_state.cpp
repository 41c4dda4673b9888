#include "lindos/interaction_state.hpp"

#include <utility>

namespace lindos {

const char* to_string(Phase phase) {
  switch (phase) {
    case Phase::idle:        return "idle";
    case Phase::validating:  return "validating";
    case Phase::thinking:    return "thinking";
    case Phase::settled:     return "settled";
    case Phase::error_shown: return "error_shown";
  }
  return "unknown";
}

InteractionStateMachine::InteractionStateMachine(std::string prompt) {
  state_.prompt = std::move(prompt);
}

bool InteractionStateMachine::begin_validation() {
  if (!state_.can_send()) return false;
  // A new send replaces whatever error was on screen.
  clear_error();
  state_.phase = Phase::validating;
  notify();
  return true;
}

bool InteractionStateMachine::begin_thinking() {
  if (state_.phase != Phase::validating) return false;
  state_.phase = Phase::thinking;
  notify();
  return true;
}

bool InteractionStateMachine::settle(std::string reply) {
  if (state_.phase != Phase::thinking) return false;
  state_.reply = std::move(reply);
  state_.phase = Phase::settled;
  notify();
  return true;
}

bool InteractionStateMachine::show_error(ErrorKind kind, std::string message,
                                         ErrorSource source, TimePoint expiry,
                                         std::string reply) {
  const bool in_send = state_.phase == Phase::validating || state_.phase == Phase::thinking;
  if (source == ErrorSource::send && !in_send) return false;
  if (source == ErrorSource::live_validation && in_send) return false;
  // A live check never hides a send error that is still on screen.
  if (source == ErrorSource::live_validation && state_.phase == Phase::error_shown &&
      state_.error_source == ErrorSource::send) {
    return false;
  }

  if (!reply.empty()) state_.reply = std::move(reply);
  state_.error = kind;
  state_.error_message = std::move(message);
  state_.error_source = source;
  state_.error_expiry = expiry;
  state_.phase = Phase::error_shown;
  notify();
  return true;
}

bool InteractionStateMachine::dismiss_error() {
  if (state_.phase != Phase::error_shown) return false;
  clear_error();
  state_.phase = state_.reply.empty() ? Phase::idle : Phase::settled;
  notify();
  return true;
}

bool InteractionStateMachine::clear() {
  if (state_.phase != Phase::error_shown) return false;
  clear_error();
  state_.reply.clear();
  state_.phase = Phase::idle;
  notify();
  return true;
}

void InteractionStateMachine::reset(std::string prompt) {
  clear_error();
  state_.reply.clear();
  state_.draft.clear();
  state_.prompt = std::move(prompt);
  state_.phase = Phase::idle;
  notify();
}

void InteractionStateMachine::clear_error() {
  state_.error.reset();
  state_.error_message.clear();
  state_.error_source = ErrorSource::send;
  state_.error_expiry = TimePoint{};
}

void InteractionStateMachine::notify() {
  if (observer_) observer_(state_);
}

}  // namespace lindos
