#pragma once

#include <atomic>

namespace polywatch {

extern std::atomic<bool> g_shutdown_requested;

// Routes SIGINT and SIGTERM to g_shutdown_requested.
void setup_signal_handlers();
void wait_for_shutdown();

}  // namespace polywatch
