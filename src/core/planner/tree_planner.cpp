#include "tree_planner.hpp"

#include <algorithm>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace pcopy::core {

using infra::ErrorCode;
using infra::make_error;

TreePlanner::TreePlanner(TransferMode mode)
    : mode_(mode) {}

auto TreePlanner::plan(const OperationTarget& target) const -> TransferPlan {
    TransferPlan plan;
    for (const auto& mapping : target.mappings) {
        plan_source(mapping, plan);
    }
    spdlog::debug("Planned {} unit(s), {} unreadable, {} bytes",
                  plan.units.size(), plan.failures.size(), plan.total_bytes());
    return plan;
}

void TreePlanner::plan_source(const SourceMapping& mapping, TransferPlan& plan) const {
    plan_entry_(mapping.source, mapping.destination, plan);
}

bool TreePlanner::reads_content_() const {
    return mode_ == TransferMode::Copy || mode_ == TransferMode::RefLink;
}

void TreePlanner::fail_(TransferUnit unit, infra::Error error, TransferPlan& plan) const {
    spdlog::warn("Cannot read {}: {}", unit.source.string(), error.message);
    plan.failures.push_back(PlanFailure{std::move(unit), std::move(error)});
}

void TreePlanner::plan_entry_(const std::filesystem::path& src,
                              const std::filesystem::path& dst,
                              TransferPlan& plan) const
{
    TransferUnit unit{.source = src, .destination = dst, .mode = mode_};

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(src, ec);
    if (ec) {
        fail_(std::move(unit), make_error(ErrorCode::TraversalError,
              fmt::format("stat {}: {}", src.string(), ec.message())), plan);
        return;
    }

    if (std::filesystem::is_symlink(status)) {
        unit.kind = UnitKind::Symlink;
        unit.link_target = std::filesystem::read_symlink(src, ec);
        if (ec) {
            fail_(std::move(unit), make_error(ErrorCode::TraversalError,
                  fmt::format("readlink {}: {}", src.string(), ec.message())), plan);
            return;
        }
        plan.units.push_back(std::move(unit));
        return;
    }

    if (std::filesystem::is_directory(status)) {
        unit.kind = UnitKind::Directory;

        // List fully before emitting the unit so an unreadable directory
        // yields exactly one (failed) unit
        std::vector<std::filesystem::path> children;
        std::filesystem::directory_iterator it(src, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec) {
            fail_(std::move(unit), make_error(ErrorCode::TraversalError,
                  fmt::format("list {}: {}", src.string(), ec.message())), plan);
            return;
        }

        std::sort(children.begin(), children.end(),
                  [](const auto& a, const auto& b) { return a.filename() < b.filename(); });

        plan.units.push_back(std::move(unit));
        for (const auto& child : children) {
            plan_entry_(child, dst / child.filename(), plan);
        }
        return;
    }

    if (std::filesystem::is_regular_file(status)) {
        unit.kind = UnitKind::File;
        unit.size_bytes = std::filesystem::file_size(src, ec);
        if (ec) {
            fail_(std::move(unit), make_error(ErrorCode::TraversalError,
                  fmt::format("size of {}: {}", src.string(), ec.message())), plan);
            return;
        }
        if (reads_content_() && ::access(src.c_str(), R_OK) != 0) {
            fail_(std::move(unit), make_error(ErrorCode::TraversalError,
                  fmt::format("{} is not readable", src.string())), plan);
            return;
        }
        plan.units.push_back(std::move(unit));
        return;
    }

    spdlog::warn("Skipping special file: {}", src.string());
}

} // namespace pcopy::core
