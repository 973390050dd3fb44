#pragma once

#include <filesystem>
#include <vector>
#include <expected>
#include "../transfer/transfer.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/progress_aggregator.hpp"

namespace pcopy::core {

class CopyEngine {
public:
    explicit CopyEngine(const infra::Config& config,
                        infra::ProgressAggregator& progress);

    // Resolve, plan and execute. An error means the run was aborted before any
    // transfer; unit failures are reported inside the RunReport instead.
    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& sources,
                           const std::filesystem::path& destination)
        -> infra::Result<RunReport>;

    // Directory units run first in plan order, everything else on the worker
    // pool. Stops scheduling once an interrupt is requested.
    [[nodiscard]] auto execute(const TransferPlan& plan) -> RunReport;

private:
    const infra::Config& config_;
    infra::ProgressAggregator& progress_;
};

} // namespace pcopy::core
