#pragma once

#include <filesystem>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace pcopy::core {

enum class OperationShape {
    FileToFile,
    FileToDirectory,
    DirectoryToDirectory,
    MultipleToDirectory,
};

// Where one source lands. Both paths are absolute and normalized.
struct SourceMapping {
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct OperationTarget {
    OperationShape shape = OperationShape::FileToFile;
    std::vector<SourceMapping> mappings;
    std::filesystem::path destination_root;
    // The destination is a directory that does not exist yet; create it before any transfer
    bool create_destination_dir = false;
};

/// Resolves CLI sources and destination into an operation shape.
///   - SourceNotFound: a source is not an existing filesystem entry.
///   - DestinationConflict: the destination exists and the copy would collide
///     (file over file without `force`, anything into a non-directory, a
///     directory into itself, two sources onto one destination).
[[nodiscard]] auto resolve_paths(const std::vector<std::filesystem::path>& sources,
                                 const std::filesystem::path& destination,
                                 bool force)
    -> infra::Result<OperationTarget>;

} // namespace pcopy::core
