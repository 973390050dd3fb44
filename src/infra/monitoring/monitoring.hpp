#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include "event_channel.hpp"
#include "progress_aggregator.hpp"

namespace pcopy::infra {

// Terminal progress bar. Drains the event channel on its own thread until
// the channel is closed, redrawing at most every 100 ms.
class ProgressMonitor {
public:
    ProgressMonitor(EventChannel<ProgressEvent>& channel, bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void consume_();
    void render_(std::uint64_t processed, std::uint64_t total) const;

    EventChannel<ProgressEvent>& channel_;
    const bool enabled_;
    const std::chrono::steady_clock::time_point start_time_;
    std::jthread render_thread_;
};

[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

} // namespace pcopy::infra
