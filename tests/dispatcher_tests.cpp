#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "lindos/client.hpp"
#include "lindos/config.hpp"
#include "lindos/dispatcher.hpp"
#include "lindos/engine.hpp"
#include "lindos/interaction_loop.hpp"
#include "lindos/interaction_state.hpp"
#include "lindos/observability.hpp"
#include "lindos/responder.hpp"
#include "lindos/worker_pool.hpp"

using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

constexpr auto kWait = 5000ms;

// Waits without pumping the loop, so posted completions stay queued.
template <typename Pred>
bool wait_off_loop(Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + kWait;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

// One chat surface: loop, client, pool and dispatcher wired together, with
// every observed phase recorded. Timers run on a ManualClock.
struct Surface {
  explicit Surface(lindos::CallMode mode = lindos::CallMode::offload)
      : clock(std::make_shared<lindos::ManualClock>()),
        loop(clock),
        pool(2),
        dispatcher(loop, client, pool, make_config(mode)) {
    dispatcher.set_observer([this](const lindos::InteractionState& s) { phases.push_back(s.phase); });
  }

  static lindos::DispatcherConfig make_config(lindos::CallMode mode) {
    lindos::DispatcherConfig c;
    c.mode = mode;
    return c;
  }

  bool settle() {
    return loop.pump_until([this] { return dispatcher.can_send(); }, kWait);
  }

  void advance(std::chrono::milliseconds d) {
    clock->advance(d);
    loop.pump();
  }

  lindos::Phase phase() const { return dispatcher.state().phase; }

  std::shared_ptr<lindos::ManualClock> clock;
  lindos::InteractionLoop loop;
  lindos::Client client;
  lindos::WorkerPool pool;
  lindos::CallDispatcher dispatcher;
  std::vector<lindos::Phase> phases;
};

// Installs a responder that replies "reply:<m>" and blocks on "first" until
// release() is called.
struct GatedResponder {
  GatedResponder() : gate(promise.get_future().share()) {
    auto g = gate;
    lindos::install_engine(std::make_shared<const lindos::Engine>(
        std::make_shared<const lindos::FunctionResponder>(
            [g](std::string_view m, std::string*) {
              if (m == "first") g.wait();
              return "reply:" + std::string(m);
            },
            "gated")));
  }
  ~GatedResponder() {
    release();
    lindos::apply_config(lindos::EngineConfig{});
  }
  void release() {
    if (!released) promise.set_value();
    released = true;
  }

  std::promise<void> promise;
  std::shared_future<void> gate;
  bool released{false};
};

// ============================================================================
// Building blocks
// ============================================================================

void test_sequence_gate() {
  lindos::SequenceGate gate;
  const auto c1 = gate.issue();
  const auto c2 = gate.issue();
  expect(gate.accept(c2), "latest is accepted");
  expect(!gate.accept(c1), "older completion after newer is dropped");
  expect(!gate.accept(c2), "duplicate completion is dropped");
  expect(gate.stale() == 2, "stale completions counted");

  const auto c3 = gate.issue();
  gate.invalidate();
  expect(!gate.accept(c3), "invalidated completion is dropped");
  const auto c5 = gate.issue();
  expect(gate.accept(c5), "fresh request after invalidate accepted");
}

void test_worker_pool_drains_on_shutdown() {
  std::atomic<int> ran{0};
  lindos::WorkerPool pool(3);
  for (int i = 0; i < 100; ++i) {
    expect(pool.submit([&ran] { ran.fetch_add(1); }), "submit accepted");
  }
  expect(pool.submit([] { throw std::runtime_error("job failed"); }), "throwing job accepted");
  expect(pool.submit([] { throw 42; }), "non-standard throw accepted");
  expect(pool.submit([&ran] { ran.fetch_add(1); }), "submit after throwing jobs");
  pool.shutdown();
  expect(ran.load() == 101, "every queued job ran before join");
  expect(pool.completed() == 103, "throwing jobs still count as completed");
  expect(!pool.submit([] {}), "submit refused after shutdown");
}

void test_loop_ordering_and_timers() {
  auto clock = std::make_shared<lindos::ManualClock>();
  lindos::InteractionLoop loop(clock);
  std::vector<int> order;

  loop.post_after(20ms, [&] { order.push_back(3); });
  const auto cancelled = loop.post_after(10ms, [&] { order.push_back(99); });
  loop.post_after(10ms, [&] { order.push_back(2); });
  loop.post([&] { order.push_back(1); });

  expect(loop.cancel(cancelled), "pending timer cancels");
  expect(!loop.cancel(cancelled), "second cancel is a no-op");
  loop.pump();
  expect(order == std::vector<int>{1}, "timers wait for the clock");
  clock->advance(10ms);
  loop.pump();
  expect(order == std::vector<int>{1, 2}, "due timer fires");
  clock->advance(10ms);
  loop.pump();
  expect(order == std::vector<int>{1, 2, 3}, "timers fire in due order");
  expect(loop.pending_timers() == 0, "no timers left");
}

void test_loop_resumes_future() {
  lindos::InteractionLoop loop;
  std::promise<int> p;
  int got = 0;
  loop.resume_when_ready<int>(p.get_future(), [&](int v) { got = v; });
  loop.pump();
  expect(got == 0, "continuation waits for the future");
  expect(loop.pending_waiters() == 1, "waiter pending");
  p.set_value(7);
  expect(loop.pump_until([&] { return got == 7; }, kWait), "continuation resumed");
  expect(loop.pending_waiters() == 0, "waiter consumed");
}

// ============================================================================
// Send path
// ============================================================================

void check_hello_flow(lindos::CallMode mode) {
  Surface s(mode);
  expect(s.phase() == lindos::Phase::idle, "starts idle");
  expect(s.dispatcher.state().prompt == "Ask anything…", "default prompt");

  expect(s.dispatcher.submit("Hello"), "submit accepted");
  expect(s.phase() == lindos::Phase::thinking, "thinking right after submit");
  expect(!s.dispatcher.can_send(), "cannot send while thinking");

  expect(s.settle(), "reply arrives");
  expect(s.phase() == lindos::Phase::settled, "settled");
  expect(s.dispatcher.state().reply == "You said: Hello", "reply text");
  expect(s.dispatcher.can_send(), "can send once settled");
  expect((s.phases == std::vector<lindos::Phase>{lindos::Phase::validating,
                                                 lindos::Phase::thinking,
                                                 lindos::Phase::settled}),
         "Idle -> Validating -> Thinking -> Settled");
  expect(s.client.engine_calls() == 1, "one engine call");
}

void test_hello_flow_offload() { check_hello_flow(lindos::CallMode::offload); }
void test_hello_flow_suspend() { check_hello_flow(lindos::CallMode::suspend); }

void test_empty_submit_skips_engine() {
  for (const char* text : {"", "   ", "\n\t"}) {
    Surface s;
    expect(s.dispatcher.submit(text), "submit accepted");
    expect(s.phase() == lindos::Phase::error_shown, "error shown immediately");
    const auto& st = s.dispatcher.state();
    expect(st.error && lindos::is_kind(*st.error, lindos::ErrorCode::empty_message),
           "empty_message kind");
    expect(st.error_message == "Invalid message: Message cannot be empty", "error line");
    expect(s.client.engine_calls() == 0, "engine not invoked");
    expect((s.phases == std::vector<lindos::Phase>{lindos::Phase::validating,
                                                   lindos::Phase::error_shown}),
           "Validating -> ErrorShown");
  }
}

void test_invalid_encoding_submit() {
  Surface s;
  s.dispatcher.submit("bad \xFF byte");
  const auto& st = s.dispatcher.state();
  expect(st.error && lindos::is_kind(*st.error, lindos::ErrorCode::invalid_encoding),
         "invalid_encoding kind");
  expect(s.client.engine_calls() == 0, "engine not invoked");
}

void test_submit_refused_while_thinking() {
  GatedResponder responder;
  Surface s;
  expect(s.dispatcher.submit("first"), "first accepted");
  expect(!s.dispatcher.submit("second"), "second refused while thinking");
  expect(s.loop.pump_until([&] { return s.client.engine_calls() >= 1; }, kWait),
         "first reaches the engine");
  responder.release();
  expect(s.settle(), "first completes");
  expect(s.dispatcher.state().reply == "reply:first", "first reply shown");
  expect(s.client.engine_calls() == 1, "only one engine call");
}

void test_message_is_trimmed() {
  Surface s;
  s.dispatcher.submit("  Hello \n");
  expect(s.settle(), "reply arrives");
  expect(s.dispatcher.state().reply == "You said: Hello", "trimmed before sending");
}

void check_out_of_order_completion(lindos::CallMode mode) {
  GatedResponder responder;
  Surface s(mode);
  s.dispatcher.submit("first");
  s.dispatcher.reset();
  expect(s.phase() == lindos::Phase::idle, "reset accepted while thinking");
  s.dispatcher.submit("second");
  expect(s.settle(), "second completes");
  expect(s.dispatcher.state().reply == "reply:second", "second reply shown");

  responder.release();
  expect(s.loop.pump_until([&] { return s.dispatcher.stale_completions() == 1; }, kWait),
         "first completion arrives and is dropped");
  expect(s.phase() == lindos::Phase::settled, "still settled");
  expect(s.dispatcher.state().reply == "reply:second", "final state reflects the later send");
}

void test_out_of_order_offload() { check_out_of_order_completion(lindos::CallMode::offload); }
void test_out_of_order_suspend() { check_out_of_order_completion(lindos::CallMode::suspend); }

void test_processing_failure_shows_apology() {
  Surface s;
  const std::string too_long(1001, 'a');
  s.dispatcher.submit(too_long);
  expect(s.settle(), "failure arrives");
  const auto& st = s.dispatcher.state();
  expect(s.phase() == lindos::Phase::error_shown, "error shown");
  expect(st.error && lindos::is_kind(*st.error, lindos::ErrorCode::processing_failure),
         "processing_failure kind");
  expect(st.error_message == "Processing failed: Failed to process message", "error line");
  expect(st.reply == s.dispatcher.config().apology, "apology replaces the reply");
}

void test_modes_agree() {
  const std::string long_text(1001, 'z');
  const std::vector<std::string> inputs{"Hello", "", "  hi ", "\xFF", long_text};
  for (const auto& text : inputs) {
    Surface a(lindos::CallMode::offload);
    Surface b(lindos::CallMode::suspend);
    a.dispatcher.submit(text);
    b.dispatcher.submit(text);
    expect(a.settle() && b.settle(), "both modes complete");
    expect(a.phase() == b.phase(), "same phase in both modes");
    expect(a.dispatcher.state().reply == b.dispatcher.state().reply, "same reply in both modes");
    expect(a.dispatcher.state().error == b.dispatcher.state().error, "same error in both modes");
    expect(a.phases == b.phases, "same transitions in both modes");
  }
}

// ============================================================================
// Error display lifecycle
// ============================================================================

void test_error_timeout_returns_to_idle() {
  Surface s;
  s.dispatcher.submit("");
  expect(s.dispatcher.state().error_expiry == s.clock->now() + 5000ms, "expiry recorded");
  s.advance(4999ms);
  expect(s.phase() == lindos::Phase::error_shown, "still shown before timeout");
  s.advance(1ms);
  expect(s.phase() == lindos::Phase::idle, "dismissed at timeout");
  expect(!s.dispatcher.state().error, "error cleared");
}

void test_error_timeout_restores_settled() {
  Surface s;
  s.dispatcher.submit("Hello");
  expect(s.settle(), "first reply");
  s.dispatcher.submit("  ");
  expect(s.phase() == lindos::Phase::error_shown, "error over settled content");
  s.advance(5000ms);
  expect(s.phase() == lindos::Phase::settled, "settled content restored");
  expect(s.dispatcher.state().reply == "You said: Hello", "previous reply kept");
}

void test_new_error_restarts_timeout() {
  Surface s;
  s.dispatcher.submit("");
  s.advance(3000ms);
  s.dispatcher.submit(" ");
  s.advance(3000ms);
  expect(s.phase() == lindos::Phase::error_shown, "second error has its own timeout");
  s.advance(2000ms);
  expect(s.phase() == lindos::Phase::idle, "second error dismissed");
}

void test_clear_and_reset() {
  Surface s;
  s.dispatcher.submit("");
  s.dispatcher.clear();
  expect(s.phase() == lindos::Phase::idle, "clear -> idle");
  expect(s.loop.pending_timers() == 0, "timeout cancelled by clear");

  s.dispatcher.submit("Hello");
  expect(s.settle(), "reply");
  s.dispatcher.reset();
  expect(s.phase() == lindos::Phase::idle, "reset -> idle");
  expect(s.dispatcher.state().reply.empty(), "reply dropped");
  expect(s.dispatcher.state().prompt == "Ask anything…", "default prompt restored");
}

// ============================================================================
// Live validation
// ============================================================================

void test_debounced_live_validation() {
  auto& stats = lindos::global_engine_stats();
  stats.reset();
  Surface s;

  s.dispatcher.on_draft_changed("\xFF");
  s.advance(200ms);
  s.dispatcher.on_draft_changed("\xFFx");
  s.advance(200ms);
  expect(s.pool.completed() == 0 && stats.total_validations.load() == 0,
         "no check before the draft is quiet for 300 ms");

  s.advance(100ms);
  expect(s.loop.pump_until([&] { return s.phase() == lindos::Phase::error_shown; }, kWait),
         "live check reports the bad draft");
  expect(stats.total_validations.load() == 1, "exactly one check for the burst");
  const auto& st = s.dispatcher.state();
  expect(st.error_source == lindos::ErrorSource::live_validation, "live error source");
  expect(st.error && lindos::is_kind(*st.error, lindos::ErrorCode::invalid_encoding),
         "invalid_encoding kind");

  s.dispatcher.on_draft_changed("fine now");
  s.advance(300ms);
  expect(s.loop.pump_until([&] { return s.phase() == lindos::Phase::idle; }, kWait),
         "valid draft withdraws the live error");

  s.dispatcher.on_draft_changed("   ");
  s.advance(300ms);
  expect(s.loop.pump_until([&] { return s.pool.completed() == 3 && s.loop.pending_tasks() == 0; },
                           kWait),
         "whitespace draft checked");
  expect(stats.total_validations.load() == 3, "three checks in total");
  expect(s.phase() == lindos::Phase::idle, "empty draft is neutral while typing");

  s.dispatcher.submit("   ");
  expect(s.dispatcher.state().error &&
             lindos::is_kind(*s.dispatcher.state().error, lindos::ErrorCode::empty_message),
         "send gate still reports empty_message");
}

void test_newer_draft_supersedes_check_in_flight() {
  Surface s;
  s.dispatcher.on_draft_changed("\xFF");
  s.advance(300ms);
  expect(wait_off_loop([&] { return s.pool.completed() == 1; }), "check of the bad draft finished");
  expect(s.loop.pending_tasks() == 1, "its verdict is queued on the loop");

  s.dispatcher.on_draft_changed("fine now");
  s.loop.pump();
  expect(s.phase() == lindos::Phase::idle, "old verdict not shown for the new draft");
  expect(!s.dispatcher.state().error, "no error recorded");
  expect(s.dispatcher.stale_completions() == 1, "old verdict counted as stale");

  s.advance(300ms);
  expect(s.loop.pump_until([&] { return s.pool.completed() == 2 && s.loop.pending_tasks() == 0; },
                           kWait),
         "new draft checked");
  expect(s.phase() == lindos::Phase::idle, "valid draft stays idle");
  expect(s.dispatcher.state().draft == "fine now", "draft kept");
}

void test_submit_cancels_pending_check() {
  Surface s;
  s.dispatcher.on_draft_changed("\xFF");
  s.dispatcher.submit("Hello");
  expect(s.loop.pending_timers() == 0, "debounce cancelled by submit");
  expect(s.settle(), "reply");
  s.advance(1000ms);
  expect(s.phase() == lindos::Phase::settled, "no late live error");
}

}  // namespace

int main() {
  std::cout << "=== lindos Dispatcher Test Suite ===\n";

  std::cout << "\n[Building Blocks]\n";
  run_test("sequence gate", test_sequence_gate);
  run_test("worker pool drains on shutdown", test_worker_pool_drains_on_shutdown);
  run_test("loop ordering and timers", test_loop_ordering_and_timers);
  run_test("loop resumes future", test_loop_resumes_future);

  std::cout << "\n[Send Path]\n";
  run_test("Hello flow (offload)", test_hello_flow_offload);
  run_test("Hello flow (suspend)", test_hello_flow_suspend);
  run_test("empty submit skips engine", test_empty_submit_skips_engine);
  run_test("invalid encoding submit", test_invalid_encoding_submit);
  run_test("submit refused while thinking", test_submit_refused_while_thinking);
  run_test("message is trimmed", test_message_is_trimmed);
  run_test("out-of-order completion (offload)", test_out_of_order_offload);
  run_test("out-of-order completion (suspend)", test_out_of_order_suspend);
  run_test("processing failure shows apology", test_processing_failure_shows_apology);
  run_test("call modes agree", test_modes_agree);

  std::cout << "\n[Error Display]\n";
  run_test("error timeout returns to idle", test_error_timeout_returns_to_idle);
  run_test("error timeout restores settled", test_error_timeout_restores_settled);
  run_test("new error restarts timeout", test_new_error_restarts_timeout);
  run_test("clear and reset", test_clear_and_reset);

  std::cout << "\n[Live Validation]\n";
  run_test("debounced live validation", test_debounced_live_validation);
  run_test("newer draft supersedes check in flight", test_newer_draft_supersedes_check_in_flight);
  run_test("submit cancels pending check", test_submit_cancels_pending_check);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
