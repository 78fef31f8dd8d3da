#pragma once

#include <atomic>

namespace imagewatch {

extern std::atomic<bool> g_shutdown_requested;

void setup_signal_handlers();
void wait_for_shutdown();
// Lets tests and embedders end wait_for_shutdown() without a signal.
void request_shutdown() noexcept;

}  // namespace imagewatch
