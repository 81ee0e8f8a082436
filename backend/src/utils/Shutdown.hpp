#pragma once

#include <chrono>

namespace tf::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Sleeps up to `timeout`, waking early when shutdown is requested.
// Returns should_shutdown().
bool wait_for_shutdown(std::chrono::milliseconds timeout);

// Routes SIGINT/SIGTERM to request_shutdown().
void install_signal_handlers();

} // namespace tf::runtime
