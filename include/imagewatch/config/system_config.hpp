#pragma once

#include "imagewatch/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace imagewatch {

enum class WatchMode { Native, Polling };

[[nodiscard]] constexpr auto watch_mode_to_string(WatchMode mode) noexcept
    -> std::string_view {
  switch (mode) {
    case WatchMode::Native: return "native";
    case WatchMode::Polling: return "polling";
  }
  return "native";
}

[[nodiscard]] inline auto string_to_watch_mode(std::string_view str) noexcept
    -> std::optional<WatchMode> {
  if (str == "native") return WatchMode::Native;
  if (str == "polling") return WatchMode::Polling;
  return std::nullopt;
}

[[nodiscard]] inline auto default_image_extensions() -> std::set<std::string> {
  return {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp"};
}

struct WatchConfig {
  std::string directory;
  // Lower-cased, including the leading dot.
  std::set<std::string> extensions{default_image_extensions()};
  std::chrono::milliseconds debounce{timing::kDefaultDebounce};
  std::size_t max_in_flight{limits::kDefaultMaxInFlight};
  WatchMode mode{WatchMode::Native};
  std::chrono::milliseconds poll_interval{timing::kDefaultPollInterval};
  std::chrono::milliseconds shutdown_timeout{timing::kDefaultShutdownTimeout};
};

struct RuntimeConfig {
  unsigned worker_threads{limits::kDefaultWorkerThreads};
};

struct ProcessorConfig {
  // Empty means the log-only processor.
  std::string command;
  std::chrono::seconds timeout{timing::kDefaultProcessorTimeout};
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct AppConfig {
  WatchConfig monitor;
  RuntimeConfig runtime;
  ProcessorConfig processor;
  LogConfig log;
};

}  // namespace imagewatch
