#include "imagewatch/cli/commands.hpp"
#include "imagewatch/config/config.hpp"
#include "imagewatch/core/event_loop.hpp"
#include "imagewatch/core/worker_pool.hpp"
#include "imagewatch/monitor/file_monitor.hpp"
#include "imagewatch/processor/command_processor.hpp"
#include "imagewatch/util/daemon.hpp"
#include "imagewatch/util/log.hpp"

#include <print>

namespace imagewatch::cli {

namespace {

auto resolve_config(const WatchOptions& opts) -> Result<AppConfig> {
  AppConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return loaded;
    }
    config = std::move(*loaded);
  }

  if (opts.directory) {
    config.monitor.directory = *opts.directory;
  }
  if (opts.polling) {
    config.monitor.mode = WatchMode::Polling;
  }
  if (opts.log_level) {
    config.log.level = *opts.log_level;
  }
  if (opts.log_file) {
    config.log.file = *opts.log_file;
  }

  if (auto valid = validate(config); !valid) {
    return std::unexpected(valid.error());
  }
  return config;
}

}  // namespace

auto cmd_watch(const WatchOptions& opts) -> int {
  auto result = resolve_config(opts);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  if (!config.log.file.empty() && !log::set_output_file(config.log.file)) {
    std::println(stderr, "Error: Failed to open log file: {}", config.log.file);
    return 1;
  }
  log::set_level(config.log.level);
  log::start();

  WorkerPool pool(config.runtime.worker_threads);
  EventLoop loop;
  pool.start();
  loop.start();

  FileMonitor monitor(config.monitor, pool, loop,
                      make_processor(config.processor));

  setup_signal_handlers();

  if (auto r = monitor.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    pool.stop();
    loop.stop();
    log::stop();
    return 1;
  }

  log::info("imagewatch running, press Ctrl+C to stop");
  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");

  monitor.stop();
  // Admitted files finish their debounce and verification before the loop
  // that runs their processors goes away.
  pool.stop();
  loop.stop();

  log::info("imagewatch stopped.");
  log::stop();
  return 0;
}

}  // namespace imagewatch::cli
