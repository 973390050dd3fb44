#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include "../transfer/transfer.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/progress_aggregator.hpp"

namespace pcopy::core {

// Executes one unit with the OS primitive its kind and mode call for.
// A failure stays with its unit: execute() never throws for I/O problems
// and never touches other units' destinations.
class TransferExecutor {
public:
    TransferExecutor(const infra::Config& config, infra::ProgressAggregator& progress);

    [[nodiscard]] auto execute(const TransferUnit& unit, std::size_t index) const -> TransferResult;

    // Applies source directory metadata once everything nested in it is written.
    void finalize_directory(const TransferUnit& unit) const;

    // Runs after a verified copy is closed and before it is read back.
    void set_before_verify(std::function<void(const std::filesystem::path&)> hook);

private:
    auto make_directory_(const TransferUnit& unit) const -> infra::VoidResult;
    auto recreate_symlink_(const TransferUnit& unit) const -> infra::VoidResult;
    auto copy_file_(const TransferUnit& unit, std::size_t index, TransferResult& result) const
        -> infra::VoidResult;
    auto hard_link_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult;
    auto symbolic_link_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult;
    auto reflink_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult;

    // AlreadyExists unless `force`; performs no writes
    auto check_destination_(const std::filesystem::path& dst) const -> infra::VoidResult;
    // Removes a forced-over entry and creates missing parents
    auto prepare_destination_(const std::filesystem::path& dst) const -> infra::VoidResult;
    auto check_same_device_(const TransferUnit& unit) const -> infra::VoidResult;

    const infra::Config& config_;
    infra::ProgressAggregator& progress_;
    std::function<void(const std::filesystem::path&)> before_verify_;
};

} // namespace pcopy::core
