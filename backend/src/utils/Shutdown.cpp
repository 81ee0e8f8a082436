#include "utils/Shutdown.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace tf::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};

// Signal handlers may only touch lock-free atomics, so waiters poll in short
// slices instead of blocking on a condition variable.
constexpr auto kWaitSlice = std::chrono::milliseconds(25);

void handle_signal(int) { request_shutdown(); }
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

bool wait_for_shutdown(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!should_shutdown()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(remaining < kWaitSlice ? remaining : kWaitSlice);
  }
  return should_shutdown();
}

void install_signal_handlers() {
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
}

} // namespace tf::runtime
