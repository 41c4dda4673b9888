#pragma once

// lindos/worker_pool.hpp - Fixed-size pool running blocking engine calls off
// the interaction thread.
//
// Jobs run in submission order per worker; with more than one worker, jobs may
// complete out of order. Callers that care about ordering tag their work with a
// SequenceGate number (dispatcher.hpp).
//
// shutdown() (and the destructor) stops accepting jobs, lets the workers drain
// everything already queued, then joins them.

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lindos {

class WorkerPool {
 public:
  using Job = std::function<void()>;

  explicit WorkerPool(uint32_t threads = 2);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false once shutdown() has been called; the job is not run.
  bool submit(Job job);

  void shutdown();

  uint32_t size() const { return static_cast<uint32_t>(workers_.size()); }
  std::size_t queue_depth() const;
  uint64_t completed() const;

 private:
  void worker_loop();

  std::vector<std::thread> workers_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Job> queue_;
  uint64_t completed_{0};
  bool stopping_{false};
};

}  // namespace lindos
