#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace pcopy::extensions {

// Applies the permission bits and modification time of `src` to `dst`.
// Symlinks are not followed on either side.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace pcopy::extensions
