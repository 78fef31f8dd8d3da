#include "imagewatch/core/event_loop.hpp"

#include "imagewatch/util/log.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace imagewatch {

namespace {

constexpr int kMaxShutdownRounds = 64;
constexpr auto kUnarmedWait = std::chrono::milliseconds(10);

auto to_timespec(std::chrono::milliseconds d) -> __kernel_timespec {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs);
  return {.tv_sec = secs.count(), .tv_nsec = nsecs.count()};
}

auto drain_eventfd(int fd) -> void {
  std::uint64_t val = 0;
  while (read(fd, &val, sizeof(val)) > 0) {
  }
}

}  // namespace

EventLoop::EventLoop(std::size_t inbox_capacity) : inbox_(inbox_capacity) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create event loop eventfd: {}", strerror(errno));
  }
  if (!ring_.valid()) {
    log::warn("io_uring unavailable, event loop falls back to poll()");
  }
}

EventLoop::~EventLoop() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

auto EventLoop::start() -> void {
  if (running_.exchange(true))
    return;

  stop_requested_.store(false, std::memory_order_release);
  shutting_down_ = false;
  accepting_.store(true);
  thread_ = std::thread([this] { run(); });
}

auto EventLoop::stop() -> void {
  if (!running_.exchange(false))
    return;

  // Pairs with the increment-then-check in schedule(): once this store is
  // visible and the counter reads zero, no producer can still be pushing.
  accepting_.store(false);
  while (schedulers_in_flight_.load() > 0) {
    std::this_thread::yield();
  }

  stop_requested_.store(true, std::memory_order_release);
  wake();

  if (thread_.joinable()) {
    thread_.join();
  }
}

auto EventLoop::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto EventLoop::is_current() const noexcept -> bool {
  return detail::current_loop == this;
}

auto EventLoop::schedule(std::coroutine_handle<> handle) -> bool {
  if (!handle)
    return false;

  schedulers_in_flight_.fetch_add(1);
  if (!accepting_.load()) {
    schedulers_in_flight_.fetch_sub(1);
    return false;
  }
  bool pushed = inbox_.push(handle);
  schedulers_in_flight_.fetch_sub(1);

  if (pushed) {
    wake();
  }
  return pushed;
}

auto EventLoop::run() -> void {
  detail::current_loop = this;

  if (ring_.valid() && !wake_armed_) {
    wake_armed_ = ring_.prepare_poll_multishot(&wake_fd_, wake_fd_);
    ring_.submit();
  }

  while (!stop_requested_.load(std::memory_order_acquire)) {
    bool has_work = drain_inbox();
    has_work |= run_ready();
    has_work |= fire_expired_timers();
    ring_.submit();
    has_work |= process_completions();

    if (!has_work) {
      wait_for_work();
    }
  }

  abandon_suspended();
  detail::current_loop = nullptr;
}

auto EventLoop::resume(std::coroutine_handle<> handle) -> void {
  if (handle && !handle.done()) {
    handle.resume();
  }
}

auto EventLoop::drain_inbox() -> bool {
  bool did_work = false;
  while (auto h = inbox_.try_pop()) {
    ready_.push_back(*h);
    did_work = true;
  }
  return did_work;
}

auto EventLoop::run_ready() -> bool {
  if (ready_.empty())
    return false;

  std::deque<std::coroutine_handle<>> batch;
  batch.swap(ready_);
  for (auto handle : batch) {
    resume(handle);
  }
  return true;
}

auto EventLoop::arm_timer(std::coroutine_handle<> handle,
                          std::chrono::milliseconds duration)
    -> detail::TimerOp* {
  auto op = std::make_unique<detail::TimerOp>();
  op->handle = handle;
  op->deadline = std::chrono::steady_clock::now() + duration;
  auto* raw = op.get();
  ops_.emplace(raw, std::move(op));
  suspended_count_.fetch_add(1, std::memory_order_acq_rel);

  if (shutting_down_) {
    raw->result = -ECANCELED;
    return raw;
  }

  raw->ts = to_timespec(duration);
  if (ring_.valid() && ring_.prepare_timeout(raw, &raw->ts)) {
    raw->in_kernel = true;
    ring_.submit();
  } else {
    fallback_timers_.push(raw);
  }
  return raw;
}

auto EventLoop::release_op(detail::TimerOp* op) -> void {
  auto handle = op->handle;
  suspended_count_.fetch_sub(1, std::memory_order_acq_rel);
  resume(handle);
  // The frame has read op->result by now (or is parked on another op).
  ops_.erase(op);
}

auto EventLoop::process_completions() -> bool {
  unsigned count = ring_.process_completions(
      [this](void* data, std::int32_t res, std::uint32_t flags) {
        if (data == &wake_fd_) {
          drain_eventfd(wake_fd_);
          if (!(flags & IORING_CQE_F_MORE)) {
            wake_armed_ = false;
          }
          return;
        }
        if (data != nullptr) {
          completions_.emplace_back(static_cast<detail::TimerOp*>(data), res);
        }
      });

  if (ring_.valid() && !wake_armed_ && wake_fd_ >= 0) {
    wake_armed_ = ring_.prepare_poll_multishot(&wake_fd_, wake_fd_);
  }

  for (auto [op, res] : completions_) {
    auto it = ops_.find(op);
    if (it == ops_.end())
      continue;
    if (op->orphaned) {
      ops_.erase(it);
      continue;
    }
    op->result = res;
    release_op(op);
  }
  completions_.clear();

  return count > 0;
}

auto EventLoop::fire_expired_timers() -> bool {
  bool did_work = false;
  auto now = std::chrono::steady_clock::now();
  while (!fallback_timers_.empty() && fallback_timers_.top()->deadline <= now) {
    auto* op = fallback_timers_.top();
    fallback_timers_.pop();
    op->result = -ETIME;
    release_op(op);
    did_work = true;
  }
  return did_work;
}

auto EventLoop::wait_for_work() -> void {
  if (!inbox_.empty() || !ready_.empty())
    return;

  auto timeout = wake_armed_ ? timing::kLoopIdleWait : kUnarmedWait;
  if (!fallback_timers_.empty()) {
    auto until = std::chrono::ceil<std::chrono::milliseconds>(
        fallback_timers_.top()->deadline - std::chrono::steady_clock::now());
    timeout = std::clamp(until, std::chrono::milliseconds(0), timeout);
  }

  if (ring_.valid()) {
    ring_.submit();
    ring_.wait(timeout);
    return;
  }

  pollfd pfd{.fd = wake_fd_, .events = POLLIN, .revents = 0};
  if (::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0 &&
      (pfd.revents & POLLIN)) {
    drain_eventfd(wake_fd_);
  }
}

auto EventLoop::wake() -> void {
  if (wake_fd_ < 0)
    return;

  std::uint64_t val = 1;
  while (true) {
    auto ret = write(wake_fd_, &val, sizeof(val));
    if (ret < 0 && errno == EINTR)
      continue;
    // EAGAIN means the counter is saturated, which already wakes the loop.
    break;
  }
}

auto EventLoop::abandon_suspended() -> void {
  shutting_down_ = true;
  fallback_timers_ = {};

  // Never-started roots are destroyed; their parameters release whatever
  // they hold.
  drain_inbox();
  for (auto handle : ready_) {
    handle.destroy();
  }
  ready_.clear();

  // Frames parked on timers are resumed with ECANCELED so they unwind
  // through their own cleanup. Timers armed meanwhile cancel immediately.
  for (int round = 0; round < kMaxShutdownRounds; ++round) {
    std::vector<detail::TimerOp*> live;
    for (auto& [ptr, op] : ops_) {
      if (!op->orphaned) {
        live.push_back(ptr);
      }
    }
    if (live.empty())
      break;

    for (auto* op : live) {
      op->result = -ECANCELED;
      if (op->in_kernel) {
        (void)ring_.prepare_cancel(op);
        op->orphaned = true;
        auto handle = op->handle;
        suspended_count_.fetch_sub(1, std::memory_order_acq_rel);
        resume(handle);
      } else {
        release_op(op);
      }
    }
  }
  ring_.submit();

  std::size_t stuck = 0;
  for (auto& [ptr, op] : ops_) {
    if (!op->orphaned) {
      op->orphaned = true;
      ++stuck;
    }
  }
  if (stuck > 0) {
    log::warn("{} coroutine(s) still suspended after event loop shutdown",
              stuck);
    suspended_count_.fetch_sub(stuck, std::memory_order_acq_rel);
  }
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) -> void {
  op_ = loop_->arm_timer(handle, duration_);
}

auto sleep_awaiter::await_resume() noexcept -> Result<void> {
  if (loop_ == nullptr)
    return fail(Error::NotRunning);
  if (op_ == nullptr)
    return ok();

  auto res = op_->result;
  op_ = nullptr;
  if (res == 0 || res == -ETIME)
    return ok();
  if (res == -ECANCELED)
    return fail(Error::Cancelled);
  return fail(std::error_code(-res, std::system_category()));
}

}  // namespace imagewatch
