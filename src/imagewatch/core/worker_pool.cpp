#include "imagewatch/core/worker_pool.hpp"

#include "imagewatch/util/log.hpp"

#include <exception>

namespace imagewatch {

WorkerPool::WorkerPool(unsigned num_threads)
    : num_threads_(num_threads == 0 ? 1 : num_threads) {
}

WorkerPool::~WorkerPool() {
  stop();
}

auto WorkerPool::start() -> void {
  {
    std::scoped_lock lock(mu_);
    if (running_)
      return;
    running_ = true;
    stopping_ = false;
  }

  threads_.reserve(num_threads_);
  for (unsigned i = 0; i < num_threads_; ++i) {
    threads_.emplace_back([this] { worker_loop(); });
  }
  log::debug("WorkerPool started with {} threads", num_threads_);
}

auto WorkerPool::stop() -> void {
  {
    std::scoped_lock lock(mu_);
    if (!running_)
      return;
    running_ = false;
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  log::debug("WorkerPool stopped");
}

auto WorkerPool::submit(Job job) -> bool {
  {
    std::scoped_lock lock(mu_);
    if (!running_)
      return false;
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

auto WorkerPool::is_running() const -> bool {
  std::scoped_lock lock(mu_);
  return running_;
}

auto WorkerPool::queued() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return jobs_.size();
}

auto WorkerPool::worker_loop() -> void {
  while (true) {
    Job job;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty())
        return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    try {
      job();
    } catch (const std::exception& e) {
      log::error("Worker job threw: {}", e.what());
    } catch (...) {
      log::error("Worker job threw a non-standard exception");
    }
  }
}

}  // namespace imagewatch
