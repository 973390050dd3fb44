#pragma once

#include <filesystem>
#include "../transfer/transfer.hpp"
#include "../path_resolver/path_resolver.hpp"

namespace pcopy::core {

// Walks sources depth-first, entries in lexicographic order, and emits a
// Directory unit before anything nested in it. Symlinks are never followed:
// they become Symlink units carrying the target read at plan time.
class TreePlanner {
public:
    explicit TreePlanner(TransferMode mode);

    [[nodiscard]] auto plan(const OperationTarget& target) const -> TransferPlan;

    // Appends the units of one source tree to `plan`.
    void plan_source(const SourceMapping& mapping, TransferPlan& plan) const;

private:
    void plan_entry_(const std::filesystem::path& src,
                     const std::filesystem::path& dst,
                     TransferPlan& plan) const;
    void fail_(TransferUnit unit, infra::Error error, TransferPlan& plan) const;
    [[nodiscard]] auto reads_content_() const -> bool;

    TransferMode mode_;
};

} // namespace pcopy::core
