#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace smartmig::infra {

extern std::atomic<bool> g_interrupted;

// Polled by long-running loops; the default reads g_interrupted.
using InterruptCheck = std::function<bool()>;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace smartmig::infra
