#include "imagewatch/watch/inotify_watcher.hpp"

#include "imagewatch/core/constants.hpp"
#include "imagewatch/util/log.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace imagewatch {

namespace {

// Returns false once the watch itself is gone (directory removed or
// unmounted); the thread exits then.
auto read_events(int fd, const std::filesystem::path& directory,
                 const WatchCallback& on_event) -> bool {
  alignas(inotify_event) std::array<char, io::kEventBufferSize> buffer{};

  while (true) {
    ssize_t len = read(fd, buffer.data(), buffer.size());
    if (len < 0) {
      if (errno == EINTR)
        continue;
      if (errno != EAGAIN) {
        log::error("inotify read failed on {}: {}", directory.string(),
                   strerror(errno));
        return false;
      }
      return true;
    }
    if (len == 0)
      return true;

    ssize_t i = 0;
    while (i < len) {
      auto* event = reinterpret_cast<inotify_event*>(buffer.data() + i);

      if (event->mask & IN_Q_OVERFLOW) {
        log::warn("inotify queue overflow on {}, events were lost",
                  directory.string());
      }
      if (event->mask & IN_IGNORED) {
        log::warn("Watch on {} was removed", directory.string());
        return false;
      }
      if ((event->mask & IN_CREATE) && event->len > 0) {
        detail::deliver_event(
            on_event, WatchEvent{.path = directory / event->name,
                                 .is_directory = (event->mask & IN_ISDIR) != 0});
      }

      i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
    }
  }
}

}  // namespace

InotifyWatcher::InotifyWatcher(std::string_view directory)
    : directory_(directory) {
}

InotifyWatcher::~InotifyWatcher() {
  request_stop();
  (void)wait_stopped(timing::kDefaultShutdownTimeout);
}

auto InotifyWatcher::start(WatchCallback on_event) -> Result<void> {
  if (is_alive()) {
    log::warn("InotifyWatcher for {} already running", directory_.string());
    return ok();
  }

  int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd < 0) {
    log::error("Failed to initialize inotify: {}", strerror(errno));
    return fail(Error::WatchFailed);
  }

  if (inotify_add_watch(fd, directory_.c_str(), IN_CREATE | IN_ONLYDIR) < 0) {
    log::error("Failed to add watch on {}: {}", directory_.string(),
               strerror(errno));
    close(fd);
    return fail(Error::WatchFailed);
  }

  auto latch = std::make_shared<detail::ExitLatch>();
  exited_ = latch;
  // The thread owns the descriptor and everything it touches, so it can
  // outlive this object after a timed-out stop.
  watch_thread_ = std::jthread([fd, dir = directory_, cb = std::move(on_event),
                                latch](std::stop_token st) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    while (!st.stop_requested()) {
      int rc = ::poll(&pfd, 1,
                      static_cast<int>(timing::kWatchPollInterval.count()));
      if (rc < 0 && errno != EINTR) {
        log::error("poll on inotify fd failed: {}", strerror(errno));
        break;
      }
      if (rc > 0 && !read_events(fd, dir, cb)) {
        break;
      }
    }
    close(fd);
    latch->signal();
  });

  log::info("InotifyWatcher started for: {}", directory_.string());
  return ok();
}

auto InotifyWatcher::request_stop() -> void {
  if (watch_thread_.joinable()) {
    watch_thread_.request_stop();
  }
}

auto InotifyWatcher::wait_stopped(std::chrono::milliseconds timeout) -> bool {
  if (!watch_thread_.joinable())
    return true;

  if (exited_->wait_for(timeout)) {
    watch_thread_.join();
    log::info("InotifyWatcher stopped");
    return true;
  }
  watch_thread_.detach();
  return false;
}

auto InotifyWatcher::is_alive() const -> bool {
  return watch_thread_.joinable() && exited_ && !exited_->done();
}

auto InotifyWatcher::directory() const -> const std::filesystem::path& {
  return directory_;
}

}  // namespace imagewatch
