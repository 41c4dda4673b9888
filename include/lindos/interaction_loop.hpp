#pragma once

// lindos/interaction_loop.hpp - Single-threaded task loop owning interaction state.
//
// The thread that calls pump()/pump_until() is the interaction thread. Every
// mutation of InteractionState happens inside a task run by that thread.
// Background threads never touch state; they post() closures here.
//
//   post()              thread-safe, FIFO.
//   post_after()        one-shot timer measured on the injected Clock.
//   resume_when_ready() polls a future without blocking and runs the
//                       continuation on the interaction thread once ready.
//
// Tasks run without the loop lock held and may post further work. An exception
// thrown by a task propagates out of pump(); tasks not yet run stay queued.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace lindos {

using TimePoint = std::chrono::steady_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SteadyClock final : public Clock {
 public:
  TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

// Only moves when advance() is called. Tests drive timers with it.
class ManualClock final : public Clock {
 public:
  TimePoint now() const override;
  void advance(std::chrono::milliseconds d);

 private:
  mutable std::mutex mu_;
  TimePoint now_{};
};

class InteractionLoop {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;

  explicit InteractionLoop(std::shared_ptr<const Clock> clock = std::make_shared<SteadyClock>());

  InteractionLoop(const InteractionLoop&) = delete;
  InteractionLoop& operator=(const InteractionLoop&) = delete;

  void post(Task task);

  TimerId post_after(std::chrono::milliseconds delay, Task task);

  // True if the timer was still pending.
  bool cancel(TimerId id);

  template <typename T>
  void resume_when_ready(std::future<T> future, std::function<void(T)> continuation) {
    auto fut = std::make_shared<std::future<T>>(std::move(future));
    add_waiter(
        [fut] { return fut->wait_for(std::chrono::seconds(0)) == std::future_status::ready; },
        [fut, cont = std::move(continuation)] { cont(fut->get()); });
  }

  // Runs every task, due timer and ready continuation until none is left.
  // Returns how many ran.
  std::size_t pump();

  // Pumps, sleeping between rounds, until pred() holds or timeout (real time)
  // elapses. Returns pred().
  bool pump_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

  const Clock& clock() const { return *clock_; }
  TimePoint now() const { return clock_->now(); }

  std::size_t pending_tasks() const;
  std::size_t pending_timers() const;
  std::size_t pending_waiters() const;

 private:
  struct Waiter {
    std::function<bool()> ready;
    Task resume;
  };

  void add_waiter(std::function<bool()> ready, Task resume);
  bool run_one();

  std::shared_ptr<const Clock> clock_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  // Keyed by (due, id) so equal deadlines fire in scheduling order.
  std::map<std::pair<TimePoint, TimerId>, Task> timers_;
  std::map<TimerId, TimePoint> timer_due_;
  std::vector<Waiter> waiters_;
  TimerId next_timer_{1};
};

}  // namespace lindos
