#include "monitoring.hpp"
#include <fmt/core.h>
#include <cmath>
#include <cstdio>

namespace pcopy::infra {

ProgressMonitor::ProgressMonitor(EventChannel<ProgressEvent>& channel, bool enabled, bool quiet)
    : channel_(channel)
    , enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    render_thread_ = std::jthread([this] { consume_(); });
}

ProgressMonitor::~ProgressMonitor() {
    // Unblocks the consumer if the run never reached finish()
    channel_.close();
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
}

void ProgressMonitor::consume_() {
    std::uint64_t processed = 0;
    std::uint64_t total = 0;
    auto last_render = std::chrono::steady_clock::time_point{};

    while (auto event = channel_.pop()) {
        processed += event->bytes_delta;
        total = event->total_bytes_known;

        auto now = std::chrono::steady_clock::now();
        if (enabled_ && now - last_render >= std::chrono::milliseconds(100)) {
            render_(processed, total);
            last_render = now;
        }
    }

    if (enabled_) {
        render_(total, total);
        std::fputs("\n", stderr);
    }
}

void ProgressMonitor::render_(std::uint64_t processed, std::uint64_t total) const {
    const double fraction = total > 0 ? static_cast<double>(processed) / static_cast<double>(total) : 1.0;
    const int bar_width = 30;
    const int filled = static_cast<int>(fraction * bar_width);

    auto elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    double bytes_per_sec = elapsed_sec > 0 ? processed / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && processed < total) {
        eta_sec = static_cast<double>(total - processed) / bytes_per_sec;
    }

    std::string eta_str = "--:--";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    const std::string bar = std::string(filled, '#') + std::string(bar_width - filled, '-');
    // ANSI: clear the line before redrawing
    fmt::print(stderr, "\r\033[K[{}] {:5.1f}% {}/s ETA {} | {}/{}",
               bar,
               fraction * 100.0,
               format_bytes(static_cast<std::uint64_t>(bytes_per_sec)),
               eta_str,
               format_bytes(processed),
               format_bytes(total));
    std::fflush(stderr);
}

std::string format_bytes(std::uint64_t bytes) {
    const char* unit = "B";
    double value = static_cast<double>(bytes);
    if (value >= 1000.0 * 1000 * 1000) { value /= 1000.0 * 1000 * 1000; unit = "GB"; }
    else if (value >= 1000.0 * 1000) { value /= 1000.0 * 1000; unit = "MB"; }
    else if (value >= 1000.0) { value /= 1000.0; unit = "kB"; }
    else { return fmt::format("{} B", bytes); }
    return fmt::format("{:.1f} {}", value, unit);
}

} // namespace pcopy::infra
