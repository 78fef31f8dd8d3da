#pragma once

#include "imagewatch/core/constants.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace imagewatch {

// Fixed set of threads for blocking work (sleeps, file I/O). Shared across
// subsystems; whoever owns it starts and stops it.
class WorkerPool {
public:
  using Job = std::move_only_function<void()>;

  explicit WorkerPool(unsigned num_threads = limits::kDefaultWorkerThreads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  auto start() -> void;
  // Lets the workers finish everything already queued, then joins them.
  auto stop() -> void;

  // Returns false (and drops `job`) when the pool is not running.
  [[nodiscard]] auto submit(Job job) -> bool;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto size() const noexcept -> unsigned {
    return num_threads_;
  }
  [[nodiscard]] auto queued() const -> std::size_t;

private:
  auto worker_loop() -> void;

  unsigned num_threads_;
  std::vector<std::jthread> threads_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool running_{false};
  bool stopping_{false};
};

}  // namespace imagewatch
