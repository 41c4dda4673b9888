#pragma once

// lindos/dispatcher.hpp - Routes user actions to the engine and engine results
// back into the interaction state machine.
//
// SEND PATH:
//   submit(text) runs the local pre-check synchronously (Validating). Invalid
//   text goes straight to ErrorShown without touching the engine. Valid text
//   is trimmed, the phase moves to Thinking and the engine call starts:
//     CallMode::offload  blocking Client::process() on the WorkerPool, result
//                        posted back to the InteractionLoop.
//     CallMode::suspend  Client::process_async() future, resumed by the loop
//                        once ready.
//   Both modes apply the result from a loop task, never inside submit().
//
// LIVE VALIDATION:
//   on_draft_changed() restarts a debounce timer. When it fires, one engine
//   validation of the latest draft runs on the pool and is posted back. An
//   empty draft is neutral here: it withdraws a live error instead of raising
//   one. The send path still reports empty_message for it.
//
// ORDERING:
//   Sends and live checks each carry a number from their own SequenceGate.
//   A completion older than the latest issued number, or not newer than the
//   last applied one, is dropped and counted in stale_completions().
//   reset() invalidates everything in flight.
//
// LIFETIME:
//   loop, client and pool must outlive the dispatcher, and the pool must be
//   shut down before the loop is destroyed. Completions that arrive after the
//   dispatcher is gone are discarded.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "lindos/client.hpp"
#include "lindos/interaction_loop.hpp"
#include "lindos/interaction_state.hpp"
#include "lindos/worker_pool.hpp"

namespace lindos {

enum class CallMode {
  offload,
  suspend,
};

struct DispatcherConfig {
  std::chrono::milliseconds debounce{300};
  std::chrono::milliseconds error_timeout{5000};
  std::string default_prompt{"Ask anything…"};
  std::string apology{"Sorry, I encountered an error while processing your message."};
  CallMode mode{CallMode::offload};
};

// Monotonic request numbering. Not thread-safe; used on the interaction thread.
class SequenceGate {
 public:
  uint64_t issue() { return ++latest_; }

  // True if seq is the latest issued and newer than the last applied.
  bool accept(uint64_t seq);

  // Makes every number issued so far stale.
  void invalidate() { ++latest_; }

  uint64_t latest() const { return latest_; }
  uint64_t applied() const { return applied_; }
  uint64_t stale() const { return stale_; }

 private:
  uint64_t latest_{0};
  uint64_t applied_{0};
  uint64_t stale_{0};
};

class CallDispatcher {
 public:
  CallDispatcher(InteractionLoop& loop, const Client& client, WorkerPool& pool,
                 DispatcherConfig config = {});
  ~CallDispatcher();

  CallDispatcher(const CallDispatcher&) = delete;
  CallDispatcher& operator=(const CallDispatcher&) = delete;

  // False (and no effect) while Validating or Thinking.
  bool submit(const std::string& text);
  bool submit(const std::string& text, CallMode mode);

  void on_draft_changed(std::string text);

  // ErrorShown -> Idle.
  void clear();

  // Any phase -> Idle with the default prompt; in-flight results are dropped.
  void reset();

  const InteractionState& state() const { return machine_.state(); }
  bool can_send() const { return machine_.state().can_send(); }
  void set_observer(InteractionStateMachine::Observer observer);

  uint64_t stale_completions() const { return send_gate_.stale() + check_gate_.stale(); }
  const DispatcherConfig& config() const { return config_; }

 private:
  void start_engine_call(uint64_t seq, std::string text, CallMode mode);
  void apply_reply(uint64_t seq, Reply reply);
  void run_live_check();
  void apply_check(uint64_t seq, ValidationOutcome outcome);
  void show_error(ErrorKind kind, std::string message, ErrorSource source,
                  std::string reply = "");
  void cancel_timer(std::optional<InteractionLoop::TimerId>& timer);

  InteractionLoop& loop_;
  const Client& client_;
  WorkerPool& pool_;
  DispatcherConfig config_;
  InteractionStateMachine machine_;
  SequenceGate send_gate_;
  SequenceGate check_gate_;
  std::optional<InteractionLoop::TimerId> debounce_timer_;
  std::optional<InteractionLoop::TimerId> error_timer_;
  // Completions hold a weak reference; expired means the dispatcher is gone.
  std::shared_ptr<CallDispatcher*> alive_;
};

}  // namespace lindos
