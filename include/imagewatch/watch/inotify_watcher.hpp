#pragma once

#include "imagewatch/watch/directory_watcher.hpp"

#include <memory>
#include <string_view>
#include <thread>

namespace imagewatch {

// Native watch backed by inotify IN_CREATE.
class InotifyWatcher final : public IDirectoryWatcher {
public:
  explicit InotifyWatcher(std::string_view directory);
  ~InotifyWatcher() override;

  InotifyWatcher(const InotifyWatcher&) = delete;
  auto operator=(const InotifyWatcher&) -> InotifyWatcher& = delete;

  [[nodiscard]] auto start(WatchCallback on_event) -> Result<void> override;
  auto request_stop() -> void override;
  [[nodiscard]] auto wait_stopped(std::chrono::milliseconds timeout)
      -> bool override;
  [[nodiscard]] auto is_alive() const -> bool override;
  [[nodiscard]] auto directory() const
      -> const std::filesystem::path& override;

private:
  std::filesystem::path directory_;
  std::jthread watch_thread_;
  std::shared_ptr<detail::ExitLatch> exited_;
};

}  // namespace imagewatch
