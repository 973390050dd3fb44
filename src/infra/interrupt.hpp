#pragma once

#include <atomic>
#include <csignal>

namespace pcopy::infra {

extern std::atomic<bool> g_interrupted;

// Routes SIGINT and SIGTERM to the interrupt flag.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

inline void request_interrupt() {
    g_interrupted.store(true, std::memory_order_relaxed);
}

// Clears a previous interrupt so an embedding program can start another run.
inline void reset_interrupt() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace pcopy::infra
