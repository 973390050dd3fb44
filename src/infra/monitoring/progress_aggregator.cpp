#include "progress_aggregator.hpp"
#include <algorithm>

namespace pcopy::infra {

void ProgressAggregator::attach(EventChannel<ProgressEvent>* channel) {
    std::lock_guard lock(mutex_);
    channel_ = channel;
}

void ProgressAggregator::begin(std::size_t total_units, std::uint64_t total_bytes) {
    std::lock_guard lock(mutex_);
    reported_.assign(total_units, 0);
    settled_.assign(total_units, false);
    settled_units_ = 0;
    total_bytes_ = total_bytes;
    processed_bytes_ = 0;
    fraction_ = 0.0;
    finished_ = false;
    start_time_ = std::chrono::steady_clock::now();
}

void ProgressAggregator::record(std::size_t unit_index, std::uint64_t bytes_delta) {
    std::lock_guard lock(mutex_);
    if (unit_index >= reported_.size() || settled_[unit_index]) {
        return;
    }
    apply_locked_(unit_index, bytes_delta);
}

void ProgressAggregator::settle(std::size_t unit_index, std::uint64_t planned_bytes) {
    std::lock_guard lock(mutex_);
    if (unit_index >= settled_.size() || settled_[unit_index]) {
        return;
    }
    if (reported_[unit_index] < planned_bytes) {
        apply_locked_(unit_index, planned_bytes - reported_[unit_index]);
    }
    settled_[unit_index] = true;
    ++settled_units_;
}

void ProgressAggregator::finish() {
    EventChannel<ProgressEvent>* channel = nullptr;
    {
        std::lock_guard lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        fraction_ = 1.0;
        channel = channel_;
    }
    if (channel) {
        channel->close();
    }
}

void ProgressAggregator::apply_locked_(std::size_t unit_index, std::uint64_t bytes_delta) {
    if (bytes_delta == 0) {
        return;
    }
    reported_[unit_index] += bytes_delta;
    processed_bytes_ += bytes_delta;
    // A file that grew after planning raises the known total
    total_bytes_ = std::max(total_bytes_, processed_bytes_);

    const double current = static_cast<double>(processed_bytes_) / static_cast<double>(total_bytes_);
    fraction_ = std::clamp(std::max(fraction_, current), 0.0, 1.0);

    if (channel_) {
        // Pushed under the lock so the channel sees events in acceptance order
        channel_->push(ProgressEvent{unit_index, bytes_delta, total_bytes_});
    }
}

auto ProgressAggregator::snapshot() const -> Snapshot {
    std::lock_guard lock(mutex_);
    return Snapshot{
        .total_units = reported_.size(),
        .settled_units = settled_units_,
        .total_bytes = total_bytes_,
        .processed_bytes = processed_bytes_,
        .fraction = fraction_,
        .finished = finished_,
        .start_time = start_time_
    };
}

double ProgressAggregator::fraction() const {
    std::lock_guard lock(mutex_);
    return fraction_;
}

} // namespace pcopy::infra
