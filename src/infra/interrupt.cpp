#include "interrupt.hpp"

namespace smartmig::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Only async-signal-safe work here: the copy loop does the logging.
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace smartmig::infra
