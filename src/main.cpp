#include "imagewatch/cli/commands.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("imagewatch - watch a directory and process new images");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Config file (YAML)");
  std::println("  -d, --dir <directory>   Directory to watch (overrides config)");
  std::println("  --polling               Scan the directory instead of inotify");
  std::println("  --log-level <level>     trace, debug, info, warn or error");
  std::println("  --log-file <file>       Append logs to a file");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -d ./images", prog);
  std::println("  {} -c imagewatch.yaml --log-level debug", prog);
}

void print_version() {
  std::println("imagewatch v0.1.0");
}

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> imagewatch::cli::WatchOptions {
  imagewatch::cli::WatchOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "-d" || arg == "--dir") {
      opts.directory = require_value(i, argc, argv, "--dir");
    } else if (arg == "--polling") {
      opts.polling = true;
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, "--log-level");
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, "--log-file");
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  if (opts.config_file.empty() && !opts.directory) {
    std::println(stderr, "Error: either --config or --dir is required");
    print_usage(argv[0]);
    std::exit(1);
  }
  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return imagewatch::cli::cmd_watch(opts);
}
