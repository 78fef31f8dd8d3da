#pragma once

#include "imagewatch/core/constants.hpp"
#include "imagewatch/core/coroutine.hpp"
#include "imagewatch/core/error.hpp"
#include "imagewatch/core/io_ring.hpp"
#include "imagewatch/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <memory>
#include <queue>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace imagewatch {

class EventLoop;

namespace detail {
inline thread_local EventLoop* current_loop = nullptr;

// One suspended timer. Owned by the loop, not by the awaiting frame, so a
// completion that arrives after the frame is gone never touches freed memory.
struct TimerOp {
  std::coroutine_handle<> handle;
  __kernel_timespec ts{};
  std::chrono::steady_clock::time_point deadline;
  std::int32_t result{0};
  bool in_kernel{false};
  // Resumed during shutdown while the kernel still holds the request; freed
  // once its completion (or the ring itself) goes away.
  bool orphaned{false};
};
}  // namespace detail

// Single-threaded cooperative executor. Any thread may hand it a coroutine
// with schedule(); the coroutine then runs (and resumes after every
// co_await) on the loop thread only.
class EventLoop {
public:
  explicit EventLoop(std::size_t inbox_capacity = limits::kLoopInboxCapacity);
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Thread-safe, never blocks. On false the caller still owns `handle`.
  [[nodiscard]] auto schedule(std::coroutine_handle<> handle) -> bool;

  [[nodiscard]] auto is_current() const noexcept -> bool;
  [[nodiscard]] auto uses_io_uring() const noexcept -> bool {
    return ring_.valid();
  }
  [[nodiscard]] auto suspended_count() const noexcept -> std::size_t {
    return suspended_count_.load(std::memory_order_acquire);
  }

private:
  friend class sleep_awaiter;

  struct TimerLater {
    auto operator()(const detail::TimerOp* a,
                    const detail::TimerOp* b) const noexcept -> bool {
      return a->deadline > b->deadline;
    }
  };

  auto arm_timer(std::coroutine_handle<> handle,
                 std::chrono::milliseconds duration) -> detail::TimerOp*;

  auto run() -> void;
  auto resume(std::coroutine_handle<> handle) -> void;
  auto drain_inbox() -> bool;
  auto run_ready() -> bool;
  auto process_completions() -> bool;
  auto fire_expired_timers() -> bool;
  auto wait_for_work() -> void;
  auto wake() -> void;
  auto release_op(detail::TimerOp* op) -> void;
  auto abandon_suspended() -> void;

  IoRing ring_;
  int wake_fd_{-1};
  bool wake_armed_{false};
  bool shutting_down_{false};

  BoundedMPSCQueue<std::coroutine_handle<>> inbox_;
  std::deque<std::coroutine_handle<>> ready_;

  std::unordered_map<detail::TimerOp*, std::unique_ptr<detail::TimerOp>> ops_;
  std::priority_queue<detail::TimerOp*, std::vector<detail::TimerOp*>,
                      TimerLater>
      fallback_timers_;
  std::vector<std::pair<detail::TimerOp*, std::int32_t>> completions_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<int> schedulers_in_flight_{0};
  std::atomic<std::size_t> suspended_count_{0};
};

class sleep_awaiter {
public:
  explicit sleep_awaiter(std::chrono::milliseconds duration) noexcept
      : loop_{detail::current_loop}, duration_{duration} {
  }

  sleep_awaiter(const sleep_awaiter&) = delete;
  sleep_awaiter& operator=(const sleep_awaiter&) = delete;

  // Off-loop callers get an immediate NotRunning instead of a hang.
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return loop_ == nullptr || duration_.count() <= 0;
  }
  auto await_suspend(std::coroutine_handle<> handle) -> void;
  [[nodiscard]] auto await_resume() noexcept -> Result<void>;

private:
  EventLoop* loop_;
  std::chrono::milliseconds duration_;
  detail::TimerOp* op_{nullptr};
};

[[nodiscard]] inline auto async_sleep(std::chrono::milliseconds duration) noexcept
    -> sleep_awaiter {
  return sleep_awaiter{duration};
}

}  // namespace imagewatch
