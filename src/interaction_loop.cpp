#include "lindos/interaction_loop.hpp"

#include <algorithm>

namespace lindos {

namespace {

// Poll interval while timers or futures are outstanding.
constexpr std::chrono::milliseconds kPollInterval{1};

}  // namespace

TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lk(mu_);
  return now_;
}

void ManualClock::advance(std::chrono::milliseconds d) {
  std::lock_guard<std::mutex> lk(mu_);
  now_ += d;
}

InteractionLoop::InteractionLoop(std::shared_ptr<const Clock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()) {}

void InteractionLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_all();
}

InteractionLoop::TimerId InteractionLoop::post_after(std::chrono::milliseconds delay, Task task) {
  const TimePoint due = clock_->now() + delay;
  TimerId id;
  {
    std::lock_guard<std::mutex> lk(mu_);
    id = next_timer_++;
    timers_.emplace(std::make_pair(due, id), std::move(task));
    timer_due_.emplace(id, due);
  }
  cv_.notify_all();
  return id;
}

bool InteractionLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = timer_due_.find(id);
  if (it == timer_due_.end()) return false;
  timers_.erase(std::make_pair(it->second, id));
  timer_due_.erase(it);
  return true;
}

void InteractionLoop::add_waiter(std::function<bool()> ready, Task resume) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    waiters_.push_back(Waiter{std::move(ready), std::move(resume)});
  }
  cv_.notify_all();
}

// Pops one runnable item under the lock and runs it outside. Posted tasks
// first, then the earliest due timer, then the first ready waiter.
bool InteractionLoop::run_one() {
  Task task;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!tasks_.empty()) {
      task = std::move(tasks_.front());
      tasks_.pop_front();
    } else if (!timers_.empty() && timers_.begin()->first.first <= clock_->now()) {
      auto it = timers_.begin();
      task = std::move(it->second);
      timer_due_.erase(it->first.second);
      timers_.erase(it);
    } else {
      auto it = std::find_if(waiters_.begin(), waiters_.end(),
                             [](const Waiter& w) { return w.ready(); });
      if (it == waiters_.end()) return false;
      task = std::move(it->resume);
      waiters_.erase(it);
    }
  }
  task();
  return true;
}

std::size_t InteractionLoop::pump() {
  std::size_t ran = 0;
  while (run_one()) ++ran;
  return ran;
}

bool InteractionLoop::pump_until(const std::function<bool()>& pred,
                                 std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    pump();
    if (pred()) return true;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;

    std::unique_lock<std::mutex> lk(mu_);
    const bool polling = !timers_.empty() || !waiters_.empty();
    const auto wake = polling ? std::min(deadline, now + kPollInterval) : deadline;
    cv_.wait_until(lk, wake, [this] { return !tasks_.empty(); });
  }
}

std::size_t InteractionLoop::pending_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tasks_.size();
}

std::size_t InteractionLoop::pending_timers() const {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.size();
}

std::size_t InteractionLoop::pending_waiters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return waiters_.size();
}

}  // namespace lindos
