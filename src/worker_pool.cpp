#include "lindos/worker_pool.hpp"

#include <exception>
#include <string>

#include "lindos/observability.hpp"

namespace lindos {

WorkerPool::WorkerPool(uint32_t threads) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (uint32_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return false;
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
  }
}

std::size_t WorkerPool::queue_depth() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

uint64_t WorkerPool::completed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return completed_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& e) {
      // A failing job must not take the worker down with it.
      write_diagnostic_line(std::string("[lindos] worker job failed: ") + e.what());
    } catch (...) {
      write_diagnostic_line("[lindos] worker job failed: non-standard exception");
    }
    std::lock_guard<std::mutex> lock(mu_);
    ++completed_;
  }
}

}  // namespace lindos
