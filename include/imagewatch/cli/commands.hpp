#pragma once

#include <optional>
#include <string>

namespace imagewatch::cli {

struct WatchOptions {
  std::string config_file;
  std::optional<std::string> directory;
  bool polling{false};
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
};

[[nodiscard]] auto cmd_watch(const WatchOptions& opts) -> int;

}  // namespace imagewatch::cli
