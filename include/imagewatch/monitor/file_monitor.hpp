#pragma once

#include "imagewatch/config/system_config.hpp"
#include "imagewatch/core/error.hpp"
#include "imagewatch/core/event_loop.hpp"
#include "imagewatch/core/worker_pool.hpp"
#include "imagewatch/monitor/event_sink.hpp"
#include "imagewatch/pipeline/admission_gate.hpp"
#include "imagewatch/pipeline/dispatcher.hpp"
#include "imagewatch/pipeline/lifecycle_tracker.hpp"
#include "imagewatch/verify/file_verifier.hpp"
#include "imagewatch/watch/directory_watcher.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>

namespace imagewatch {

struct MonitorStats {
  bool running{false};
  TrackerStats tracker;
};

[[nodiscard]] auto to_json(const MonitorStats& stats) -> nlohmann::json;

// Wires a directory watch to the admission pipeline. The WorkerPool and the
// EventLoop are shared with the rest of the process; this class never
// starts or stops them.
class FileMonitor {
public:
  FileMonitor(WatchConfig config, WorkerPool& pool, EventLoop& loop,
              FileProcessor processor,
              std::shared_ptr<const IFileVerifier> verifier =
                  create_image_verifier(),
              std::shared_ptr<EventSink> sink = std::make_shared<EventSink>());
  ~FileMonitor();

  FileMonitor(const FileMonitor&) = delete;
  auto operator=(const FileMonitor&) -> FileMonitor& = delete;

  // Each start() begins a fresh activation with empty tracking state.
  [[nodiscard]] auto start() -> Result<void>;
  // Bounded by shutdown_timeout. Work already admitted keeps running.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const -> bool;

  [[nodiscard]] auto stats() const -> MonitorStats;
  [[nodiscard]] auto config() const noexcept -> const WatchConfig& {
    return config_;
  }
  [[nodiscard]] auto events() const noexcept -> EventSink& {
    return *sink_;
  }

private:
  auto teardown() -> void;
  static auto shutdown_watcher(IDirectoryWatcher& watcher,
                               const WatchConfig& config) -> void;

  WatchConfig config_;
  WorkerPool& pool_;
  EventLoop& loop_;
  FileProcessor processor_;
  std::shared_ptr<const IFileVerifier> verifier_;
  std::shared_ptr<EventSink> sink_;

  mutable std::mutex mu_;
  std::shared_ptr<LifecycleTracker> tracker_;
  std::shared_ptr<AdmissionGate> gate_;
  std::unique_ptr<IDirectoryWatcher> watcher_;
};

}  // namespace imagewatch
