#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace pcopy::core {

enum class TransferMode {
    Copy,
    HardLink,
    SymLink,
    RefLink,
};

enum class UnitKind {
    File,
    Directory,
    Symlink,
};

enum class TransferStatus {
    Success,
    Skipped,
    Failed,
};

[[nodiscard]] auto to_string(TransferMode mode) -> std::string_view;
[[nodiscard]] auto to_string(UnitKind kind) -> std::string_view;
[[nodiscard]] auto to_string(TransferStatus status) -> std::string_view;

// One independently schedulable copy or link operation. Paths are absolute.
struct TransferUnit {
    std::filesystem::path source;
    std::filesystem::path destination;
    UnitKind kind = UnitKind::File;
    std::uint64_t size_bytes = 0;          // 0 for directories and symlinks
    TransferMode mode = TransferMode::Copy;
    std::filesystem::path link_target;     // Symlink units: target as read at plan time
};

// An entry the planner could not read. It still counts as a unit of the run.
struct PlanFailure {
    TransferUnit unit;
    infra::Error error;
};

// Directory units precede every unit nested under them; destinations are unique.
struct TransferPlan {
    std::vector<TransferUnit> units;
    std::vector<PlanFailure> failures;

    [[nodiscard]] auto total_bytes() const -> std::uint64_t;
    [[nodiscard]] auto unit_count() const -> std::size_t { return units.size() + failures.size(); }
};

struct TransferResult {
    TransferUnit unit;
    TransferStatus status = TransferStatus::Success;
    std::optional<infra::Error> error;     // set for Skipped and Failed
    std::uint64_t bytes_copied = 0;
    std::optional<bool> verified;          // nullopt: verification not applicable

    [[nodiscard]] auto ok() const -> bool { return status == TransferStatus::Success; }
};

struct RunReport {
    std::uint64_t total_units = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t skipped = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    bool interrupted = false;
    std::vector<TransferResult> results;

    [[nodiscard]] auto failures() const -> std::vector<const TransferResult*>;
};

} // namespace pcopy::core
