#include "transfer.hpp"

namespace pcopy::core {

std::string_view to_string(TransferMode mode) {
    switch (mode) {
        case TransferMode::Copy:     return "copy";
        case TransferMode::HardLink: return "hard-link";
        case TransferMode::SymLink:  return "symlink";
        case TransferMode::RefLink:  return "reflink";
    }
    return "unknown";
}

std::string_view to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::File:      return "file";
        case UnitKind::Directory: return "directory";
        case UnitKind::Symlink:   return "symlink";
    }
    return "unknown";
}

std::string_view to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Success: return "success";
        case TransferStatus::Skipped: return "skipped";
        case TransferStatus::Failed:  return "failed";
    }
    return "unknown";
}

std::uint64_t TransferPlan::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& unit : units) {
        if (unit.kind == UnitKind::File) {
            total += unit.size_bytes;
        }
    }
    for (const auto& failure : failures) {
        total += failure.unit.size_bytes;
    }
    return total;
}

std::vector<const TransferResult*> RunReport::failures() const {
    std::vector<const TransferResult*> out;
    for (const auto& result : results) {
        if (result.status == TransferStatus::Failed) {
            out.push_back(&result);
        }
    }
    return out;
}

} // namespace pcopy::core
