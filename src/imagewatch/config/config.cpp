#include "imagewatch/config/config.hpp"

#include "imagewatch/config/yaml_utils.hpp"
#include "imagewatch/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <fstream>
#include <sstream>

namespace {

// One year; anything beyond is a typo, and NaN or inf cannot be converted.
constexpr double kMaxConfigSeconds = 365.0 * 24 * 60 * 60;

template <typename Duration>
auto seconds_to(double seconds, Duration& out) -> bool {
  if (!std::isfinite(seconds) || std::abs(seconds) > kMaxConfigSeconds) {
    return false;
  }
  out = std::chrono::duration_cast<Duration>(
      std::chrono::duration<double>(seconds));
  return true;
}

// yaml-cpp happily wraps "-1" into an unsigned; read signed and range-check.
template <typename T>
auto decode_count(const YAML::Node& node, std::string_view key, T default_val,
                  T& out) -> bool {
  auto value = imagewatch::yaml_get_or<long long>(
      node, key, static_cast<long long>(default_val));
  if (value < 0) {
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

}  // namespace

namespace YAML {

template <>
struct convert<imagewatch::WatchConfig> {
  static bool decode(const Node& node, imagewatch::WatchConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.directory = imagewatch::yaml_get_or<std::string>(node, "directory", "");

    if (auto exts = node["extensions"]) {
      if (!exts.IsSequence()) {
        return false;
      }
      w.extensions.clear();
      for (const auto& ext : exts) {
        w.extensions.insert(
            imagewatch::normalize_extension(ext.as<std::string>()));
      }
    }

    if (!seconds_to(imagewatch::yaml_get_or(node, "debounce_seconds", 1.0),
                    w.debounce)) {
      return false;
    }
    if (!decode_count(node, "max_in_flight",
                      imagewatch::limits::kDefaultMaxInFlight,
                      w.max_in_flight)) {
      return false;
    }

    auto mode_str =
        imagewatch::yaml_get_or<std::string>(node, "watch_mode", "native");
    auto mode = imagewatch::string_to_watch_mode(mode_str);
    if (!mode) {
      return false;
    }
    w.mode = *mode;

    w.poll_interval = std::chrono::milliseconds(
        imagewatch::yaml_get_or<long long>(node, "poll_interval_ms", 1000));
    return seconds_to(
        imagewatch::yaml_get_or(node, "shutdown_timeout_seconds", 5.0),
        w.shutdown_timeout);
  }
};

template <>
struct convert<imagewatch::RuntimeConfig> {
  static bool decode(const Node& node, imagewatch::RuntimeConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    return decode_count(node, "worker_threads",
                        imagewatch::limits::kDefaultWorkerThreads,
                        r.worker_threads);
  }
};

template <>
struct convert<imagewatch::ProcessorConfig> {
  static bool decode(const Node& node, imagewatch::ProcessorConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.command = imagewatch::yaml_get_or<std::string>(node, "command", "");
    p.timeout = std::chrono::seconds(
        imagewatch::yaml_get_or<long long>(node, "timeout_seconds", 300));
    return true;
  }
};

template <>
struct convert<imagewatch::LogConfig> {
  static bool decode(const Node& node, imagewatch::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = imagewatch::yaml_get_or<std::string>(node, "level", "info");
    l.file = imagewatch::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<imagewatch::AppConfig> {
  static bool decode(const Node& node, imagewatch::AppConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto monitor = node["monitor"]) {
      c.monitor = monitor.as<imagewatch::WatchConfig>();
    }
    if (auto runtime = node["runtime"]) {
      c.runtime = runtime.as<imagewatch::RuntimeConfig>();
    }
    if (auto processor = node["processor"]) {
      c.processor = processor.as<imagewatch::ProcessorConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<imagewatch::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace imagewatch {

auto normalize_extension(std::string_view ext) -> std::string {
  std::string out;
  out.reserve(ext.size() + 1);
  if (!ext.empty() && ext.front() != '.') {
    out.push_back('.');
  }
  std::ranges::transform(ext, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<AppConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<AppConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    AppConfig config = root.as<AppConfig>();
    return ok(std::move(config));
  } catch (const YAML::BadConversion& e) {
    log::error("Invalid config value: {}", e.what());
    return fail(Error::InvalidConfig);
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto validate(const AppConfig& config) -> Result<void> {
  const auto& m = config.monitor;
  if (m.directory.empty()) {
    log::error("monitor.directory is required");
    return fail(Error::InvalidConfig);
  }
  if (m.max_in_flight == 0) {
    log::error("monitor.max_in_flight must be positive");
    return fail(Error::InvalidConfig);
  }
  if (m.debounce.count() < 0) {
    log::error("monitor.debounce_seconds must not be negative");
    return fail(Error::InvalidConfig);
  }
  if (m.poll_interval.count() <= 0) {
    log::error("monitor.poll_interval_ms must be positive");
    return fail(Error::InvalidConfig);
  }
  if (m.shutdown_timeout.count() < 0) {
    log::error("monitor.shutdown_timeout_seconds must not be negative");
    return fail(Error::InvalidConfig);
  }
  if (config.runtime.worker_threads == 0) {
    log::error("runtime.worker_threads must be positive");
    return fail(Error::InvalidConfig);
  }
  if (config.processor.timeout.count() <= 0) {
    log::error("processor.timeout_seconds must be positive");
    return fail(Error::InvalidConfig);
  }
  return ok();
}

}  // namespace imagewatch
