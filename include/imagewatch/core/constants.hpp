#pragma once

#include <chrono>
#include <cstddef>

namespace imagewatch {

namespace io {
inline constexpr std::size_t kEventBufferSize = 4096;
inline constexpr std::size_t kHeaderProbeSize = 64;
}  // namespace io

namespace timing {
// How long the inotify thread blocks in poll() before rechecking its stop token.
inline constexpr auto kWatchPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kDefaultPollInterval = std::chrono::milliseconds(1000);
inline constexpr auto kDefaultDebounce = std::chrono::milliseconds(1000);
inline constexpr auto kDefaultShutdownTimeout = std::chrono::seconds(5);
inline constexpr auto kLoopIdleWait = std::chrono::milliseconds(1000);
inline constexpr auto kChildPollInterval = std::chrono::milliseconds(20);
inline constexpr auto kDefaultProcessorTimeout = std::chrono::seconds(300);
}  // namespace timing

namespace limits {
inline constexpr std::size_t kDefaultMaxInFlight = 100;
inline constexpr std::size_t kLoopInboxCapacity = 4096;
inline constexpr unsigned kDefaultWorkerThreads = 4;
}  // namespace limits

}  // namespace imagewatch
