#include "imagewatch/watch/polling_watcher.hpp"

#include "imagewatch/core/constants.hpp"
#include "imagewatch/util/log.hpp"

#include <condition_variable>
#include <mutex>
#include <set>
#include <system_error>

namespace imagewatch {

namespace {

using Snapshot = std::set<std::filesystem::path>;

auto scan(const std::filesystem::path& directory, Snapshot& out)
    -> std::error_code {
  std::error_code ec;
  Snapshot entries;
  for (std::filesystem::directory_iterator it(directory, ec), end;
       !ec && it != end; it.increment(ec)) {
    entries.insert(it->path());
  }
  if (!ec) {
    out = std::move(entries);
  }
  return ec;
}

}  // namespace

PollingWatcher::PollingWatcher(std::string_view directory,
                               std::chrono::milliseconds interval)
    : directory_(directory), interval_(interval) {
}

PollingWatcher::~PollingWatcher() {
  request_stop();
  (void)wait_stopped(timing::kDefaultShutdownTimeout);
}

auto PollingWatcher::start(WatchCallback on_event) -> Result<void> {
  if (is_alive()) {
    log::warn("PollingWatcher for {} already running", directory_.string());
    return ok();
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    log::error("Cannot poll {}: not a directory", directory_.string());
    return fail(Error::WatchFailed);
  }

  Snapshot known;
  if (auto scan_ec = scan(directory_, known)) {
    log::error("Failed to scan {}: {}", directory_.string(), scan_ec.message());
    return fail(Error::WatchFailed);
  }

  auto latch = std::make_shared<detail::ExitLatch>();
  exited_ = latch;
  poll_thread_ = std::jthread([dir = directory_, interval = interval_,
                               cb = std::move(on_event), latch,
                               known = std::move(known)](
                                  std::stop_token st) mutable {
    std::mutex mu;
    std::condition_variable_any cv;
    bool scan_failing = false;

    while (true) {
      {
        std::unique_lock lock(mu);
        if (cv.wait_for(lock, st, interval, [] { return false; }) ||
            st.stop_requested()) {
          break;
        }
      }

      Snapshot current;
      if (auto ec = scan(dir, current)) {
        if (!scan_failing) {
          log::warn("Failed to scan {}: {}", dir.string(), ec.message());
          scan_failing = true;
        }
        continue;
      }
      scan_failing = false;

      for (const auto& path : current) {
        if (known.contains(path))
          continue;
        std::error_code type_ec;
        bool is_dir = std::filesystem::is_directory(path, type_ec);
        detail::deliver_event(cb, WatchEvent{.path = path, .is_directory = is_dir});
        if (st.stop_requested())
          break;
      }
      known = std::move(current);
    }
    latch->signal();
  });

  log::info("PollingWatcher started for: {} (every {}ms)", directory_.string(),
            interval_.count());
  return ok();
}

auto PollingWatcher::request_stop() -> void {
  if (poll_thread_.joinable()) {
    poll_thread_.request_stop();
  }
}

auto PollingWatcher::wait_stopped(std::chrono::milliseconds timeout) -> bool {
  if (!poll_thread_.joinable())
    return true;

  if (exited_->wait_for(timeout)) {
    poll_thread_.join();
    log::info("PollingWatcher stopped");
    return true;
  }
  poll_thread_.detach();
  return false;
}

auto PollingWatcher::is_alive() const -> bool {
  return poll_thread_.joinable() && exited_ && !exited_->done();
}

auto PollingWatcher::directory() const -> const std::filesystem::path& {
  return directory_;
}

}  // namespace imagewatch
