#include "copy_engine.hpp"
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../executor/transfer_executor.hpp"
#include "../path_resolver/path_resolver.hpp"
#include "../planner/tree_planner.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace pcopy::core {

namespace {

TransferResult skipped_result(const TransferUnit& unit) {
    return TransferResult{
        .unit = unit,
        .status = TransferStatus::Skipped,
        .error = infra::make_error(infra::ErrorCode::Interrupted, "Not started: interrupted"),
    };
}

RunReport summarize(std::vector<std::optional<TransferResult>>& slots) {
    RunReport report;
    report.total_units = slots.size();
    report.results.reserve(slots.size());
    for (auto& slot : slots) {
        if (!slot) continue;
        switch (slot->status) {
            case TransferStatus::Success: ++report.succeeded; break;
            case TransferStatus::Failed:  ++report.failed; break;
            case TransferStatus::Skipped: ++report.skipped; break;
        }
        report.total_bytes += slot->bytes_copied;
        report.results.push_back(std::move(*slot));
    }
    return report;
}

} // namespace

CopyEngine::CopyEngine(const infra::Config& config,
                       infra::ProgressAggregator& progress)
    : config_(config), progress_(progress) {}

auto CopyEngine::run(const std::vector<std::filesystem::path>& sources,
                     const std::filesystem::path& destination)
    -> infra::Result<RunReport>
{
    auto target = resolve_paths(sources, destination, config_.force);
    if (!target) {
        return std::unexpected(infra::log_and_return(std::move(target.error())));
    }

    if (target->create_destination_dir) {
        std::error_code ec;
        std::filesystem::create_directories(target->destination_root, ec);
        if (ec) {
            return std::unexpected(infra::log_and_return(infra::make_error(
                infra::ErrorCode::DestinationConflict,
                fmt::format("Cannot create destination {}: {}",
                            target->destination_root.string(), ec.message()))));
        }
    }

    const auto plan = TreePlanner{config_.mode}.plan(*target);
    spdlog::info("Transferring {} unit(s), {} bytes ({})",
                 plan.unit_count(), plan.total_bytes(), to_string(config_.mode));
    return execute(plan);
}

auto CopyEngine::execute(const TransferPlan& plan) -> RunReport
{
    const auto start_time = std::chrono::steady_clock::now();
    const std::size_t unit_count = plan.units.size();

    progress_.begin(plan.unit_count(), plan.total_bytes());

    std::vector<std::optional<TransferResult>> slots(plan.unit_count());
    std::mutex slots_mutex;
    auto store = [&](std::size_t index, TransferResult result) {
        const auto planned = result.unit.size_bytes;
        {
            std::lock_guard lock(slots_mutex);
            slots[index] = std::move(result);
        }
        progress_.settle(index, planned);
    };

    // Unreadable entries found while planning are already final
    for (std::size_t i = 0; i < plan.failures.size(); ++i) {
        const auto& failure = plan.failures[i];
        store(unit_count + i, TransferResult{
            .unit = failure.unit,
            .status = TransferStatus::Failed,
            .error = failure.error,
        });
    }

    TransferExecutor executor(config_, progress_);

    // Parents precede children in the plan, so running directories in plan
    // order creates every directory before anything nested in it starts
    for (std::size_t i = 0; i < unit_count; ++i) {
        const auto& unit = plan.units[i];
        if (unit.kind != UnitKind::Directory) continue;
        store(i, infra::is_interrupted() ? skipped_result(unit) : executor.execute(unit, i));
    }

    {
        infra::ThreadPool pool{config_.worker_count()};
        for (std::size_t i = 0; i < unit_count; ++i) {
            if (plan.units[i].kind == UnitKind::Directory) continue;
            pool.enqueue([&, i] {
                const auto& unit = plan.units[i];
                if (infra::is_interrupted()) {
                    store(i, skipped_result(unit));
                    return;
                }
                try {
                    store(i, executor.execute(unit, i));
                } catch (const std::exception& e) {
                    store(i, TransferResult{
                        .unit = unit,
                        .status = TransferStatus::Failed,
                        .error = infra::log_and_return(infra::make_error(
                            infra::ErrorCode::Unknown,
                            fmt::format("{}: {}", unit.source.string(), e.what()))),
                    });
                }
            });
        }
        pool.wait();
    }

    // Deepest first, so a read-only directory is locked down only after its contents
    for (std::size_t i = unit_count; i-- > 0;) {
        const auto& unit = plan.units[i];
        if (unit.kind == UnitKind::Directory && slots[i] && slots[i]->ok()) {
            executor.finalize_directory(unit);
        }
    }

    progress_.finish();

    auto report = summarize(slots);
    report.interrupted = infra::is_interrupted();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return report;
}

} // namespace pcopy::core
