#pragma once

#include "imagewatch/watch/directory_watcher.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <thread>

namespace imagewatch {

// Scans the directory every `interval` and reports entries that were not
// there on the previous scan. Entries present at start() are never reported.
class PollingWatcher final : public IDirectoryWatcher {
public:
  PollingWatcher(std::string_view directory,
                 std::chrono::milliseconds interval);
  ~PollingWatcher() override;

  PollingWatcher(const PollingWatcher&) = delete;
  auto operator=(const PollingWatcher&) -> PollingWatcher& = delete;

  [[nodiscard]] auto start(WatchCallback on_event) -> Result<void> override;
  auto request_stop() -> void override;
  [[nodiscard]] auto wait_stopped(std::chrono::milliseconds timeout)
      -> bool override;
  [[nodiscard]] auto is_alive() const -> bool override;
  [[nodiscard]] auto directory() const
      -> const std::filesystem::path& override;

private:
  std::filesystem::path directory_;
  std::chrono::milliseconds interval_;
  std::jthread poll_thread_;
  std::shared_ptr<detail::ExitLatch> exited_;
};

}  // namespace imagewatch
