#include "interrupt.hpp"
#include <unistd.h>

namespace pcopy::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        // spdlog is not async-signal-safe
        constexpr char msg[] = "\nInterrupt received, finishing in-flight transfers...\n";
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace pcopy::infra
