#include "transfer_executor.hpp"

#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"

namespace pcopy::core {

using infra::ErrorCode;
using infra::make_error;

TransferExecutor::TransferExecutor(const infra::Config& config, infra::ProgressAggregator& progress)
    : config_(config), progress_(progress) {}

auto TransferExecutor::execute(const TransferUnit& unit, std::size_t index) const -> TransferResult
{
    TransferResult result{.unit = unit};

    infra::VoidResult outcome;
    if (unit.mode == TransferMode::HardLink && unit.kind != UnitKind::Symlink) {
        // Nothing may be written when the whole hard link would cross devices.
        // Symlinks are recreated as links, which works across devices.
        outcome = check_same_device_(unit);
    }

    if (outcome) {
        switch (unit.kind) {
            case UnitKind::Directory:
                outcome = make_directory_(unit);
                break;
            case UnitKind::Symlink:
                outcome = recreate_symlink_(unit);
                break;
            case UnitKind::File:
                switch (unit.mode) {
                    case TransferMode::Copy:     outcome = copy_file_(unit, index, result); break;
                    case TransferMode::HardLink: outcome = hard_link_(unit, index); break;
                    case TransferMode::SymLink:  outcome = symbolic_link_(unit, index); break;
                    case TransferMode::RefLink:  outcome = reflink_(unit, index); break;
                }
                break;
        }
    }

    if (!outcome) {
        result.status = outcome.error().code == ErrorCode::Interrupted
                            ? TransferStatus::Skipped
                            : TransferStatus::Failed;
        result.error = infra::log_and_return(std::move(outcome.error()));
        return result;
    }

    result.status = TransferStatus::Success;
    spdlog::debug("{} {} -> {}", to_string(unit.kind), unit.source.string(), unit.destination.string());
    return result;
}

void TransferExecutor::set_before_verify(std::function<void(const std::filesystem::path&)> hook) {
    before_verify_ = std::move(hook);
}

void TransferExecutor::finalize_directory(const TransferUnit& unit) const {
    if (!config_.preserve_metadata) {
        return;
    }
    if (auto res = extensions::copy_metadata(unit.source, unit.destination); !res) {
        spdlog::warn("Failed to copy metadata for {}: {}",
                     unit.destination.string(), res.error().message);
    }
}

auto TransferExecutor::check_destination_(const std::filesystem::path& dst) const -> infra::VoidResult {
    if (adapters::fs::entry_exists(dst) && !config_.force) {
        return std::unexpected(make_error(ErrorCode::AlreadyExists,
            fmt::format("Destination already exists: {}", dst.string())));
    }
    return {};
}

auto TransferExecutor::prepare_destination_(const std::filesystem::path& dst) const -> infra::VoidResult {
    if (config_.force) {
        if (auto res = adapters::fs::remove_non_directory(dst); !res) {
            return res;
        }
    }
    return adapters::fs::ensure_parent_dirs(dst);
}

auto TransferExecutor::check_same_device_(const TransferUnit& unit) const -> infra::VoidResult {
    auto src_dev = adapters::fs::device_of(unit.source);
    if (!src_dev) {
        return std::unexpected(std::move(src_dev.error()));
    }
    const auto anchor = adapters::fs::nearest_existing_ancestor(unit.destination.parent_path());
    auto dst_dev = adapters::fs::device_of(anchor);
    if (!dst_dev) {
        return std::unexpected(std::move(dst_dev.error()));
    }
    if (*src_dev != *dst_dev) {
        return std::unexpected(make_error(ErrorCode::CrossDevice,
            fmt::format("Cannot hard link {} to {}: different filesystems",
                        unit.source.string(), unit.destination.string())));
    }
    return {};
}

auto TransferExecutor::make_directory_(const TransferUnit& unit) const -> infra::VoidResult {
    const auto& dst = unit.destination;
    std::error_code ec;
    const auto status = std::filesystem::status(dst, ec);

    if (std::filesystem::is_directory(status)) {
        if (!config_.force) {
            return std::unexpected(make_error(ErrorCode::AlreadyExists,
                fmt::format("Directory already exists: {}", dst.string())));
        }
        return {};
    }
    if (adapters::fs::entry_exists(dst)) {
        return std::unexpected(make_error(ErrorCode::DestinationConflict,
            fmt::format("Cannot create directory {}: a non-directory is in the way", dst.string())));
    }

    std::filesystem::create_directories(dst, ec);
    if (ec) {
        const auto code = ec == std::errc::file_exists || ec == std::errc::not_a_directory
                              ? ErrorCode::DestinationConflict
                              : ErrorCode::IoFailure;
        return std::unexpected(infra::make_system_error(code, "create directory", dst.string(), ec.value()));
    }
    return {};
}

auto TransferExecutor::recreate_symlink_(const TransferUnit& unit) const -> infra::VoidResult {
    if (auto res = check_destination_(unit.destination); !res) return res;
    if (auto res = prepare_destination_(unit.destination); !res) return res;
    return adapters::fs::symbolic_link(unit.link_target, unit.destination);
}

auto TransferExecutor::copy_file_(const TransferUnit& unit, std::size_t index, TransferResult& result) const
    -> infra::VoidResult
{
    const auto& dst = unit.destination;
    if (auto res = check_destination_(dst); !res) return res;
    if (auto res = prepare_destination_(dst); !res) return res;

    auto src_fd = adapters::fs::open_for_read(unit.source);
    if (!src_fd) {
        return std::unexpected(std::move(src_fd.error()));
    }
    auto dst_fd = adapters::fs::create_exclusive(dst);
    if (!dst_fd) {
        return std::unexpected(std::move(dst_fd.error()));
    }

    std::optional<infra::StreamingHasher> hasher;
    if (config_.verify) {
        hasher.emplace();
    }

    auto copied = adapters::fs::stream_copy(
        src_fd->get(), dst_fd->get(), config_.chunk_size(),
        adapters::fs::select_strategy(unit.size_bytes),
        [&](std::span<const char> chunk) {
            if (hasher) hasher->update(chunk);
            progress_.record(index, chunk.size());
        });

    infra::VoidResult closed = copied ? dst_fd->close() : infra::VoidResult{};
    if (!copied || !closed) {
        // A partial destination is never left behind
        dst_fd->reset();
        ::unlink(dst.c_str());
        return std::unexpected(std::move(copied ? closed.error() : copied.error()));
    }
    result.bytes_copied = *copied;

    if (hasher) {
        if (before_verify_) {
            before_verify_(dst);
        }
        auto match = infra::XXHashVerifier::verify_against(hasher->digest(), dst, config_.chunk_size());
        if (!match) {
            return std::unexpected(std::move(match.error()));
        }
        result.verified = *match;
        if (!*match) {
            return std::unexpected(make_error(ErrorCode::HashMismatch,
                fmt::format("Verification failed for {}", dst.string())));
        }
    }

    // Metadata only after successful verification
    if (config_.preserve_metadata) {
        if (auto res = extensions::copy_metadata(unit.source, dst); !res) {
            spdlog::warn("Failed to copy metadata for {}: {}", dst.string(), res.error().message);
        }
    }
    return {};
}

auto TransferExecutor::hard_link_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult {
    if (auto res = check_destination_(unit.destination); !res) return res;
    if (auto res = prepare_destination_(unit.destination); !res) return res;
    if (auto res = adapters::fs::hard_link(unit.source, unit.destination); !res) return res;
    progress_.record(index, unit.size_bytes);
    return {};
}

auto TransferExecutor::symbolic_link_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult {
    if (auto res = check_destination_(unit.destination); !res) return res;
    if (auto res = prepare_destination_(unit.destination); !res) return res;
    // The source path was made absolute at plan time and is stored as-is
    if (auto res = adapters::fs::symbolic_link(unit.source, unit.destination); !res) return res;
    progress_.record(index, unit.size_bytes);
    return {};
}

auto TransferExecutor::reflink_(const TransferUnit& unit, std::size_t index) const -> infra::VoidResult {
    if (auto res = check_destination_(unit.destination); !res) return res;
    if (auto res = prepare_destination_(unit.destination); !res) return res;
    if (auto res = adapters::fs::reflink(unit.source, unit.destination); !res) return res;
    if (config_.preserve_metadata) {
        if (auto res = extensions::copy_metadata(unit.source, unit.destination); !res) {
            spdlog::warn("Failed to copy metadata for {}: {}",
                         unit.destination.string(), res.error().message);
        }
    }
    progress_.record(index, unit.size_bytes);
    return {};
}

} // namespace pcopy::core
