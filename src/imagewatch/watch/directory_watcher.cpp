#include "imagewatch/watch/directory_watcher.hpp"

#include "imagewatch/util/log.hpp"
#include "imagewatch/watch/inotify_watcher.hpp"
#include "imagewatch/watch/polling_watcher.hpp"

#include <exception>

namespace imagewatch {

namespace detail {

auto deliver_event(const WatchCallback& on_event,
                   const WatchEvent& event) noexcept -> void {
  if (!on_event)
    return;
  try {
    on_event(event);
  } catch (const std::exception& e) {
    log::error("Watch callback failed for {}: {}", event.path.string(),
               e.what());
  }
}

}  // namespace detail

auto create_directory_watcher(const WatchConfig& config)
    -> std::unique_ptr<IDirectoryWatcher> {
  switch (config.mode) {
    case WatchMode::Polling:
      return std::make_unique<PollingWatcher>(config.directory,
                                              config.poll_interval);
    case WatchMode::Native:
      break;
  }
  return std::make_unique<InotifyWatcher>(config.directory);
}

}  // namespace imagewatch
