#include "path_resolver.hpp"

#include <set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace pcopy::core {

namespace {

using infra::ErrorCode;
using infra::make_error;

// Absolute, normalized, without a trailing separator
std::filesystem::path normalize(const std::filesystem::path& path) {
    auto abs = std::filesystem::absolute(path).lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

bool ends_with_separator(const std::filesystem::path& path) {
    const auto& text = path.native();
    return !text.empty() && text.back() == std::filesystem::path::preferred_separator;
}

bool is_within(const std::filesystem::path& child, const std::filesystem::path& parent) {
    std::error_code ec;
    const auto c = std::filesystem::weakly_canonical(child, ec);
    const auto p = std::filesystem::weakly_canonical(parent, ec);
    if (ec) return false;
    const auto rel = c.lexically_relative(p);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

auto resolve_paths(const std::vector<std::filesystem::path>& sources,
                   const std::filesystem::path& destination,
                   bool force)
    -> infra::Result<OperationTarget>
{
    if (sources.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "No source given"));
    }

    std::vector<std::filesystem::path> resolved_sources;
    for (const auto& source : sources) {
        if (!adapters::fs::entry_exists(source)) {
            return std::unexpected(make_error(ErrorCode::SourceNotFound,
                                              fmt::format("No such source file {}", source.string())));
        }
        resolved_sources.push_back(normalize(source));
    }

    OperationTarget target;
    target.destination_root = normalize(destination);
    const auto& dest = target.destination_root;

    std::error_code ec;
    const bool dest_exists = adapters::fs::entry_exists(dest);
    const bool dest_is_dir = std::filesystem::is_directory(dest, ec);
    const bool dest_wants_dir = ends_with_separator(destination);

    auto into_dest = [&](const std::filesystem::path& src) {
        return SourceMapping{src, dest / src.filename()};
    };

    if (resolved_sources.size() > 1) {
        target.shape = OperationShape::MultipleToDirectory;
        if (dest_exists && !dest_is_dir) {
            return std::unexpected(make_error(ErrorCode::DestinationConflict,
                fmt::format("Destination {} is not a directory", dest.string())));
        }
        target.create_destination_dir = !dest_exists;
        for (const auto& src : resolved_sources) {
            target.mappings.push_back(into_dest(src));
        }
    } else {
        const auto& src = resolved_sources.front();
        const bool src_is_dir = std::filesystem::is_directory(std::filesystem::symlink_status(src, ec));

        if (src_is_dir) {
            target.shape = OperationShape::DirectoryToDirectory;
            if (dest_exists && !dest_is_dir) {
                return std::unexpected(make_error(ErrorCode::DestinationConflict,
                    fmt::format("Cannot copy directory {} onto non-directory {}",
                                src.string(), dest.string())));
            }
            target.mappings.push_back(dest_is_dir ? into_dest(src) : SourceMapping{src, dest});
        } else if (dest_is_dir) {
            target.shape = OperationShape::FileToDirectory;
            target.mappings.push_back(into_dest(src));
        } else if (dest_wants_dir && !dest_exists) {
            target.shape = OperationShape::FileToDirectory;
            target.create_destination_dir = true;
            target.mappings.push_back(into_dest(src));
        } else {
            target.shape = OperationShape::FileToFile;
            if (dest_exists) {
                if (std::filesystem::equivalent(src, dest, ec)) {
                    return std::unexpected(make_error(ErrorCode::DestinationConflict,
                        fmt::format("{} and {} are the same file", src.string(), dest.string())));
                }
                if (!force) {
                    return std::unexpected(make_error(ErrorCode::DestinationConflict,
                        fmt::format("File already exists at {}. Use -f to overwrite.", dest.string())));
                }
            }
            target.mappings.push_back(SourceMapping{src, dest});
        }
    }

    std::set<std::filesystem::path> seen;
    for (const auto& mapping : target.mappings) {
        if (!seen.insert(mapping.destination).second) {
            return std::unexpected(make_error(ErrorCode::DestinationConflict,
                fmt::format("More than one source maps to {}", mapping.destination.string())));
        }
        if (std::filesystem::is_directory(std::filesystem::symlink_status(mapping.source, ec))
            && (mapping.destination == mapping.source || is_within(mapping.destination, mapping.source))) {
            return std::unexpected(make_error(ErrorCode::DestinationConflict,
                fmt::format("Cannot copy {} into itself ({})",
                            mapping.source.string(), mapping.destination.string())));
        }
    }

    spdlog::debug("Resolved {} source(s) into {}", target.mappings.size(), dest.string());
    return target;
}

} // namespace pcopy::core
