#include <filesystem>
#include <expected>
#include <fmt/core.h>
#include "metadata.hpp"

namespace pcopy::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    const auto status = std::filesystem::symlink_status(src, ec);
    if (ec || std::filesystem::is_symlink(status)) {
        return {};
    }

    std::error_code time_ec;
    auto time = std::filesystem::last_write_time(src, time_ec);
    if (!time_ec) {
        std::filesystem::last_write_time(dst, time, time_ec);
    }

    std::error_code perm_ec;
    std::filesystem::permissions(dst, status.permissions(),
                                 std::filesystem::perm_options::replace, perm_ec);

    if (time_ec || perm_ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
            fmt::format("Metadata copy failed for {}: {}", dst.string(),
                        (time_ec ? time_ec : perm_ec).message())));
    }
    return {};
}

} // namespace pcopy::extensions
