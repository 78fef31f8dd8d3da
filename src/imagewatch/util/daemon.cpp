#include "imagewatch/util/daemon.hpp"

#include <csignal>

namespace imagewatch {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  request_shutdown();
}
}  // namespace

void setup_signal_handlers() {
  g_shutdown_requested.store(false, std::memory_order_release);
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_all();
}

}  // namespace imagewatch
