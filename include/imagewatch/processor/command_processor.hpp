#pragma once

#include "imagewatch/config/system_config.hpp"
#include "imagewatch/pipeline/dispatcher.hpp"

#include <chrono>
#include <string>

namespace imagewatch {

// Runs `/bin/sh -c command` with the file path as $1. Non-zero exit or
// running past `timeout` is a failure; the child's process group is killed
// on timeout or when the loop shuts down.
[[nodiscard]] auto make_command_processor(std::string command,
                                          std::chrono::seconds timeout)
    -> FileProcessor;

// Logs each file and succeeds.
[[nodiscard]] auto make_logging_processor() -> FileProcessor;

[[nodiscard]] auto make_processor(const ProcessorConfig& config)
    -> FileProcessor;

}  // namespace imagewatch
