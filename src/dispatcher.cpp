#include "lindos/dispatcher.hpp"

#include <utility>

#include "lindos/text.hpp"

namespace lindos {

namespace {

std::string invalid_line(const std::string& message) { return "Invalid message: " + message; }
std::string failed_line(const std::string& message) { return "Processing failed: " + message; }

}  // namespace

bool SequenceGate::accept(uint64_t seq) {
  if (seq < latest_ || seq <= applied_) {
    ++stale_;
    return false;
  }
  applied_ = seq;
  return true;
}

CallDispatcher::CallDispatcher(InteractionLoop& loop, const Client& client, WorkerPool& pool,
                               DispatcherConfig config)
    : loop_(loop),
      client_(client),
      pool_(pool),
      config_(std::move(config)),
      machine_(config_.default_prompt),
      alive_(std::make_shared<CallDispatcher*>(this)) {}

CallDispatcher::~CallDispatcher() {
  cancel_timer(debounce_timer_);
  cancel_timer(error_timer_);
}

void CallDispatcher::set_observer(InteractionStateMachine::Observer observer) {
  machine_.set_observer(std::move(observer));
}

bool CallDispatcher::submit(const std::string& text) { return submit(text, config_.mode); }

bool CallDispatcher::submit(const std::string& text, CallMode mode) {
  if (!machine_.begin_validation()) return false;
  cancel_timer(error_timer_);
  // Pending live checks describe a draft that is being sent now.
  cancel_timer(debounce_timer_);
  check_gate_.invalidate();

  const ValidationOutcome pre = client_.precheck(text);
  if (!pre.ok()) {
    show_error(pre.error, invalid_line(client_.error_message(pre.error)), ErrorSource::send);
    return true;
  }

  machine_.begin_thinking();
  const uint64_t seq = send_gate_.issue();
  start_engine_call(seq, std::string(trim_whitespace(text.c_str())), mode);
  return true;
}

void CallDispatcher::start_engine_call(uint64_t seq, std::string text, CallMode mode) {
  std::weak_ptr<CallDispatcher*> token = alive_;

  if (mode == CallMode::suspend) {
    loop_.resume_when_ready<Reply>(client_.process_async(std::move(text)),
                                   [token, seq](Reply reply) {
                                     if (auto self = token.lock()) {
                                       (*self)->apply_reply(seq, std::move(reply));
                                     }
                                   });
    return;
  }

  const Client& client = client_;
  InteractionLoop& loop = loop_;
  const bool queued = pool_.submit([&client, &loop, token, seq, text = std::move(text)] {
    Reply reply = client.process(text);
    loop.post([token, seq, reply = std::move(reply)]() mutable {
      if (auto self = token.lock()) (*self)->apply_reply(seq, std::move(reply));
    });
  });
  if (!queued) {
    loop_.post([token, seq] {
      if (auto self = token.lock()) {
        (*self)->apply_reply(seq, Reply::failure(ErrorCode::processing_failure,
                                                 "worker pool is shut down"));
      }
    });
  }
}

void CallDispatcher::apply_reply(uint64_t seq, Reply reply) {
  if (!send_gate_.accept(seq)) return;
  if (machine_.phase() != Phase::thinking) return;

  if (reply.ok) {
    machine_.settle(std::move(reply.text));
    return;
  }
  show_error(reply.error, failed_line(client_.error_message(reply.error)), ErrorSource::send,
             config_.apology);
}

void CallDispatcher::on_draft_changed(std::string text) {
  machine_.set_draft(std::move(text));
  cancel_timer(debounce_timer_);
  // A check still in flight describes the previous draft.
  check_gate_.invalidate();
  std::weak_ptr<CallDispatcher*> token = alive_;
  debounce_timer_ = loop_.post_after(config_.debounce, [token] {
    if (auto self = token.lock()) (*self)->run_live_check();
  });
}

void CallDispatcher::run_live_check() {
  debounce_timer_.reset();
  const uint64_t seq = check_gate_.issue();
  std::weak_ptr<CallDispatcher*> token = alive_;
  const Client& client = client_;
  InteractionLoop& loop = loop_;
  const bool queued = pool_.submit([&client, &loop, token, seq, draft = state().draft] {
    const ValidationOutcome outcome = client.validate(draft);
    loop.post([token, seq, outcome] {
      if (auto self = token.lock()) (*self)->apply_check(seq, outcome);
    });
  });
  // Pool is shut down: this check never completes. The send path still validates.
  if (!queued) check_gate_.invalidate();
}

void CallDispatcher::apply_check(uint64_t seq, ValidationOutcome outcome) {
  if (!check_gate_.accept(seq)) return;
  if (!can_send()) return;

  const bool neutral = outcome.ok() || is_kind(outcome.error, ErrorCode::empty_message);
  if (neutral) {
    const auto& s = machine_.state();
    if (s.phase == Phase::error_shown && s.error_source == ErrorSource::live_validation) {
      cancel_timer(error_timer_);
      machine_.dismiss_error();
    }
    return;
  }
  show_error(outcome.error, invalid_line(client_.error_message(outcome.error)),
             ErrorSource::live_validation);
}

void CallDispatcher::show_error(ErrorKind kind, std::string message, ErrorSource source,
                                std::string reply) {
  const TimePoint expiry = loop_.now() + config_.error_timeout;
  if (!machine_.show_error(kind, std::move(message), source, expiry, std::move(reply))) return;

  cancel_timer(error_timer_);
  std::weak_ptr<CallDispatcher*> token = alive_;
  error_timer_ = loop_.post_after(config_.error_timeout, [token] {
    auto self = token.lock();
    if (!self) return;
    (*self)->error_timer_.reset();
    (*self)->machine_.dismiss_error();
  });
}

void CallDispatcher::clear() {
  cancel_timer(error_timer_);
  machine_.clear();
}

void CallDispatcher::reset() {
  cancel_timer(debounce_timer_);
  cancel_timer(error_timer_);
  send_gate_.invalidate();
  check_gate_.invalidate();
  machine_.reset(config_.default_prompt);
}

void CallDispatcher::cancel_timer(std::optional<InteractionLoop::TimerId>& timer) {
  if (timer) loop_.cancel(*timer);
  timer.reset();
}

}  // namespace lindos
