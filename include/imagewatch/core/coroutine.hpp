#pragma once

#include "imagewatch/util/log.hpp"

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace imagewatch {

template <typename T>
class task;

class final_awaiter {
public:
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  // A task only starts when awaited, so there is always a continuation;
  // the awaiting side destroys the finished frame.
  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) const noexcept
      -> std::coroutine_handle<> {
    if (auto continuation = h.promise().continuation()) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  auto await_resume() const noexcept -> void {
  }
};

class task_promise_base {
public:
  [[nodiscard]] auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }
  [[nodiscard]] auto final_suspend() const noexcept -> final_awaiter {
    return {};
  }

  // Exceptions are parked and rethrown to the awaiting coroutine.
  auto unhandled_exception() noexcept -> void {
    exception_ = std::current_exception();
  }

  [[nodiscard]] auto continuation() const noexcept -> std::coroutine_handle<> {
    return continuation_;
  }

  auto set_continuation(std::coroutine_handle<> c) noexcept -> void {
    continuation_ = c;
  }

protected:
  auto rethrow_if_failed() const -> void {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

private:
  std::coroutine_handle<> continuation_;
  std::exception_ptr exception_;
};

template <typename T>
class task_promise : public task_promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<T>;

  template <typename U>
    requires std::convertible_to<U&&, T>
  auto return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
      -> void {
    result_.emplace(std::forward<U>(value));
  }

  [[nodiscard]] auto take_result() -> T {
    rethrow_if_failed();
    return std::move(*result_);
  }

private:
  std::optional<T> result_;
};

template <>
class task_promise<void> : public task_promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<void>;

  auto return_void() const noexcept -> void {
  }

  auto take_result() const -> void {
    rethrow_if_failed();
  }
};

// Lazily started coroutine; runs when co_awaited and owns its frame until then.
template <typename T = void>
class [[nodiscard]] task {
public:
  using promise_type = task_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;
  explicit task(handle_type h) noexcept : handle_(h) {
  }

  task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
  }

  task& operator=(task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  task(const task&) = delete;
  task& operator=(const task&) = delete;

  ~task() {
    destroy();
  }

  [[nodiscard]] auto valid() const noexcept -> bool {
    return static_cast<bool>(handle_);
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return !handle_ || handle_.done();
  }

  class awaiter {
  public:
    explicit awaiter(handle_type h) noexcept : handle_(h) {
    }

    awaiter(const awaiter&) = delete;
    awaiter& operator=(const awaiter&) = delete;

    ~awaiter() {
      if (handle_) {
        handle_.destroy();
      }
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !handle_ || handle_.done();
    }

    auto await_suspend(std::coroutine_handle<> continuation) noexcept
        -> std::coroutine_handle<> {
      handle_.promise().set_continuation(continuation);
      return handle_;
    }

    auto await_resume() -> T {
      return handle_.promise().take_result();
    }

  private:
    handle_type handle_;
  };

  [[nodiscard]] auto operator co_await() && noexcept -> awaiter {
    return awaiter{std::exchange(handle_, nullptr)};
  }

private:
  auto destroy() noexcept -> void {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  handle_type handle_;
};

template <typename T>
auto task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto task_promise<void>::get_return_object() noexcept -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

// Fire-and-forget root coroutine. Starts suspended; whoever take()s the
// handle resumes it once (normally through EventLoop::schedule). The frame
// frees itself when the body finishes, so nothing else may destroy it after
// the first resume.
class [[nodiscard]] spawn_task {
public:
  struct promise_type {
    [[nodiscard]] auto get_return_object() noexcept -> spawn_task {
      return spawn_task{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    [[nodiscard]] auto initial_suspend() const noexcept
        -> std::suspend_always {
      return {};
    }
    [[nodiscard]] auto final_suspend() const noexcept -> std::suspend_never {
      return {};
    }
    auto return_void() const noexcept -> void {
    }
    auto unhandled_exception() const noexcept -> void {
      try {
        throw;
      } catch (const std::exception& e) {
        log::error("Detached coroutine ended with exception: {}", e.what());
      } catch (...) {
        log::error("Detached coroutine ended with a non-standard exception");
      }
    }
  };

  spawn_task() noexcept = default;
  explicit spawn_task(std::coroutine_handle<promise_type> h) noexcept
      : handle_(h) {
  }

  spawn_task(spawn_task&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {
  }
  spawn_task& operator=(spawn_task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  spawn_task(const spawn_task&) = delete;
  spawn_task& operator=(const spawn_task&) = delete;

  ~spawn_task() {
    destroy();
  }

  [[nodiscard]] auto take() noexcept -> std::coroutine_handle<> {
    return std::exchange(handle_, nullptr);
  }

private:
  // Only reached for a frame that was never started.
  auto destroy() noexcept -> void {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  std::coroutine_handle<promise_type> handle_;
};

}  // namespace imagewatch
