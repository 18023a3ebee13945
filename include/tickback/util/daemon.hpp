#pragma once

#include <atomic>

namespace tickback {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();

}  // namespace tickback
