#include "imagewatch/monitor/file_monitor.hpp"

#include "imagewatch/pipeline/debounce_worker.hpp"
#include "imagewatch/util/log.hpp"

namespace imagewatch {

auto to_json(const MonitorStats& stats) -> nlohmann::json {
  return {{"running", stats.running},
          {"pending", stats.tracker.pending},
          {"verifying", stats.tracker.verifying},
          {"processing", stats.tracker.processing},
          {"dropped", stats.tracker.dropped}};
}

FileMonitor::FileMonitor(WatchConfig config, WorkerPool& pool, EventLoop& loop,
                         FileProcessor processor,
                         std::shared_ptr<const IFileVerifier> verifier,
                         std::shared_ptr<EventSink> sink)
    : config_(std::move(config)),
      pool_(pool),
      loop_(loop),
      processor_(std::move(processor)),
      verifier_(std::move(verifier)),
      sink_(std::move(sink)) {
  if (!sink_) {
    sink_ = std::make_shared<EventSink>();
  }
}

FileMonitor::~FileMonitor() {
  stop();
}

auto FileMonitor::start() -> Result<void> {
  std::scoped_lock lock(mu_);

  if (watcher_) {
    if (watcher_->is_alive()) {
      log::info("FileMonitor for {} already running", config_.directory);
      return ok();
    }
    // The watch died on its own (directory removed); start over.
    log::warn("Previous watch on {} is gone, restarting", config_.directory);
    teardown();
  }

  auto tracker = std::make_shared<LifecycleTracker>();
  auto dispatcher =
      std::make_shared<Dispatcher>(tracker, loop_, processor_, sink_);
  auto worker = std::make_shared<DebounceWorker>(
      tracker, verifier_, std::move(dispatcher), sink_, config_.debounce);
  auto gate = std::make_shared<AdmissionGate>(config_, tracker,
                                              std::move(worker), pool_, sink_);

  auto watcher = create_directory_watcher(config_);
  auto started = watcher->start([gate](const WatchEvent& event) {
    if (event.is_directory)
      return;
    gate->on_created(event.path.string());
  });
  if (!started) {
    log::error("Failed to start monitoring {}: {}", config_.directory,
               started.error().message());
    return std::unexpected(started.error());
  }

  tracker_ = std::move(tracker);
  gate_ = std::move(gate);
  watcher_ = std::move(watcher);

  log::info("Monitoring {} ({} mode, debounce {}ms, max in flight {})",
            config_.directory, watch_mode_to_string(config_.mode),
            config_.debounce.count(), config_.max_in_flight);
  return ok();
}

auto FileMonitor::stop() -> void {
  std::unique_ptr<IDirectoryWatcher> watcher;
  std::shared_ptr<LifecycleTracker> tracker;
  {
    std::scoped_lock lock(mu_);
    if (!watcher_)
      return;
    watcher = std::move(watcher_);
    tracker = std::move(tracker_);
    gate_.reset();
  }

  // Waited on without mu_ held.
  shutdown_watcher(*watcher, config_);
  watcher.reset();

  auto final_stats = MonitorStats{.running = false, .tracker = tracker->stats()};
  log::info("Stopped monitoring {}: {}", config_.directory,
            to_json(final_stats).dump());
}

auto FileMonitor::is_running() const -> bool {
  std::scoped_lock lock(mu_);
  return watcher_ && watcher_->is_alive();
}

auto FileMonitor::stats() const -> MonitorStats {
  std::scoped_lock lock(mu_);
  MonitorStats stats;
  stats.running = watcher_ && watcher_->is_alive();
  if (tracker_) {
    stats.tracker = tracker_->stats();
  }
  return stats;
}

auto FileMonitor::teardown() -> void {
  shutdown_watcher(*watcher_, config_);
  watcher_.reset();
  gate_.reset();
  tracker_.reset();
}

auto FileMonitor::shutdown_watcher(IDirectoryWatcher& watcher,
                                   const WatchConfig& config) -> void {
  watcher.request_stop();
  if (!watcher.wait_stopped(config.shutdown_timeout)) {
    log::warn("{}: watcher on {} did not exit within {}ms, detached",
              make_error_code(Error::Timeout).message(), config.directory,
              config.shutdown_timeout.count());
  }
}

}  // namespace imagewatch
