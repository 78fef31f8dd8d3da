#pragma once

#include "imagewatch/config/system_config.hpp"
#include "imagewatch/core/error.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

namespace imagewatch {

struct WatchEvent {
  std::filesystem::path path;
  bool is_directory{false};
};

using WatchCallback = std::function<void(const WatchEvent&)>;

namespace detail {
// Signalled by a watch thread on its way out. Shared with the thread so a
// detached thread can still signal after its watcher is gone.
class ExitLatch {
public:
  auto signal() -> void {
    {
      std::scoped_lock lock(mu_);
      done_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, timeout, [this] { return done_; });
  }

  [[nodiscard]] auto done() const -> bool {
    std::scoped_lock lock(mu_);
    return done_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool done_{false};
};

// Runs the callback on the watch thread; a throwing callback is logged and
// the thread keeps going.
auto deliver_event(const WatchCallback& on_event,
                   const WatchEvent& event) noexcept -> void;
}  // namespace detail

// Non-recursive watch on one directory, delivering creation events on a
// thread of its own.
class IDirectoryWatcher {
public:
  virtual ~IDirectoryWatcher() = default;

  // Registers the watch and starts delivering. Fails with WatchFailed when
  // the directory cannot be watched; nothing is started in that case.
  [[nodiscard]] virtual auto start(WatchCallback on_event) -> Result<void> = 0;

  virtual auto request_stop() -> void = 0;

  // Joins the delivery thread if it exits within `timeout`; otherwise
  // detaches it and returns false.
  [[nodiscard]] virtual auto wait_stopped(std::chrono::milliseconds timeout)
      -> bool = 0;

  [[nodiscard]] virtual auto is_alive() const -> bool = 0;
  [[nodiscard]] virtual auto directory() const
      -> const std::filesystem::path& = 0;
};

[[nodiscard]] auto create_directory_watcher(const WatchConfig& config)
    -> std::unique_ptr<IDirectoryWatcher>;

}  // namespace imagewatch
