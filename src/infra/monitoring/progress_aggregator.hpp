#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>
#include "event_channel.hpp"

namespace pcopy::infra {

struct ProgressEvent {
    std::size_t unit_index = 0;
    std::uint64_t bytes_delta = 0;
    std::uint64_t total_bytes_known = 0;
};

// Single synchronization point for byte accounting across concurrent units.
// Every accepted delta is forwarded, in acceptance order, to the attached channel.
class ProgressAggregator {
public:
    struct Snapshot {
        std::size_t total_units = 0;
        std::size_t settled_units = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        double fraction = 0.0;
        bool finished = false;
        std::chrono::steady_clock::time_point start_time{};
    };

    ProgressAggregator() = default;
    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // The channel must outlive the run; it is closed by finish().
    void attach(EventChannel<ProgressEvent>* channel);

    void begin(std::size_t total_units, std::uint64_t total_bytes);
    void record(std::size_t unit_index, std::uint64_t bytes_delta);

    // Marks a unit done. Planned bytes it never reported (failure, skip,
    // a file that shrank) are folded in so the run still reaches 100%.
    void settle(std::size_t unit_index, std::uint64_t planned_bytes);

    void finish();

    [[nodiscard]] auto snapshot() const -> Snapshot;
    [[nodiscard]] auto fraction() const -> double;

private:
    void apply_locked_(std::size_t unit_index, std::uint64_t bytes_delta);

    mutable std::mutex mutex_;
    EventChannel<ProgressEvent>* channel_ = nullptr;
    std::vector<std::uint64_t> reported_;
    std::vector<bool> settled_;
    std::size_t settled_units_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t processed_bytes_ = 0;
    double fraction_ = 0.0;
    bool finished_ = false;
    std::chrono::steady_clock::time_point start_time_{};
};

} // namespace pcopy::infra
