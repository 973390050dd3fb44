#include <chrono>
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/awake/awake_guard.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/event_channel.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/monitoring/progress_aggregator.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"

using REPORT = pcopy::core::RunReport;

constexpr auto load_from_cli = pcopy::infra::config_from_cli;
constexpr auto args_parser = pcopy::args_parser::parse_args;

static auto
__out_report_verse(const REPORT& report, bool quiet)
-> void {
    if (!quiet) {
        const double seconds = report.elapsed.count() / 1000.0;
        spdlog::info("Units: {}", report.total_units);
        spdlog::info("Succeeded: {}", report.succeeded);
        spdlog::info("Failed: {}", report.failed);
        spdlog::info("Skipped: {}", report.skipped);
        spdlog::info("Bytes copied: {} ({:.2f} MB)",
                     report.total_bytes,
                     report.total_bytes / 1024.0 / 1024.0);
        spdlog::info("Time elapsed: {:.2f} seconds", seconds);
        if (report.total_bytes > 0 && report.elapsed.count() > 0) {
            spdlog::info("Average speed: {:.2f} MB/s", (report.total_bytes / 1024.0 / 1024.0) / seconds);
        }
    }
    for (const auto* failure : report.failures()) {
        spdlog::error("Failed {} {}: {}: {}",
                      pcopy::core::to_string(failure->unit.kind),
                      failure->unit.source.string(),
                      failure->error ? pcopy::infra::to_string(failure->error->code) : "Unknown",
                      failure->error ? failure->error->message : "");
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        pcopy::infra::install_signal_handler();

        int exit_code = 0;
        auto args_opt = args_parser(argc, argv, exit_code);
        if (!args_opt) {
            return exit_code; // --help, --version or usage error
        }
        const auto& args = *args_opt;

        // 1. File config
        auto config_res = pcopy::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return pcopy::infra::EXIT_ABORTED;
        }
        auto config = config_res.value();

        // 2. CLI overrides
        const auto cli_config = load_from_cli(args);
        if (auto levels = pcopy::infra::apply_log_levels(config, cli_config); !levels) {
            spdlog::error("Invalid configuration: {}", levels.error().message);
            return pcopy::infra::EXIT_ABORTED;
        }
        config.merge_with(cli_config);

        if (auto valid = config.validate(); !valid) {
            spdlog::error("Invalid configuration: {}", valid.error().message);
            return pcopy::infra::EXIT_ABORTED;
        }

        std::vector<std::filesystem::path> source_paths(args.sources.begin(), args.sources.end());
        std::filesystem::path destination_path(args.destination);

        pcopy::infra::EventChannel<pcopy::infra::ProgressEvent> events;
        pcopy::infra::ProgressAggregator progress;
        const bool show_progress = config.progress && !config.quiet;
        if (show_progress) {
            progress.attach(&events);
        }

        std::optional<pcopy::infra::Result<REPORT>> result;
        {
            // Renderer joins before the summary is printed
            pcopy::infra::ProgressMonitor monitor(events, show_progress, config.quiet);
            auto lease = pcopy::infra::acquire_awake(config.awake, pcopy::infra::system_power_manager());

            pcopy::core::CopyEngine engine(config, progress);
            result.emplace(engine.run(source_paths, destination_path));
            progress.finish();
        }

        if (!*result) {
            spdlog::error("Copy aborted: {}", result->error().message);
            return result->error().to_exit_code();
        }

        const auto& report = **result;
        __out_report_verse(report, config.quiet);

        if (report.interrupted) {
            spdlog::warn("Interrupted: {} unit(s) not transferred", report.skipped);
            return pcopy::infra::EXIT_INTERRUPTED;
        }
        if (report.failed > 0) {
            return pcopy::infra::EXIT_RUN_HAD_FAILURES;
        }
        if (!config.quiet) {
            spdlog::info("Copy completed successfully.");
        }
        return pcopy::infra::EXIT_RUN_OK;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return pcopy::infra::EXIT_ABORTED;
    }
}
