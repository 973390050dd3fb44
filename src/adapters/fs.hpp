#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <utility>
#include <sys/types.h>
#include "../infra/error_handler/error.hpp"

namespace pcopy::adapters::fs {

// Owning file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }
    void reset(int fd = -1) noexcept;

    // Closes and reports the close error (write-back failures surface here)
    [[nodiscard]] auto close() -> infra::VoidResult;

private:
    int fd_ = -1;
};

enum class CopyStrategy {
    Buffered,    // read/write syscalls
    Uring,       // io_uring on Linux, large files
};

inline constexpr std::uint64_t URING_THRESHOLD = 100'000'000;

[[nodiscard]] auto select_strategy(std::uint64_t file_size) -> CopyStrategy;

// Called once per chunk after it has been written to the destination.
using ChunkCallback = std::function<void(std::span<const char>)>;

/// Streams `src_fd` into `dst_fd` in `chunk_size` pieces until EOF. Stops at the
/// next chunk boundary with ErrorCode::Interrupted once an interrupt is requested.
/// Returns the number of bytes written.
[[nodiscard]] auto stream_copy(
    int src_fd,
    int dst_fd,
    std::size_t chunk_size,
    CopyStrategy strategy,
    const ChunkCallback& on_chunk
) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto open_for_read(const std::filesystem::path& path) -> infra::Result<UniqueFd>;

/// Creates a new regular file with default-safe permissions (0666 & ~umask).
/// An existing entry yields ErrorCode::AlreadyExists.
[[nodiscard]] auto create_exclusive(const std::filesystem::path& path) -> infra::Result<UniqueFd>;

/// Hard link `dst` to the inode of `src`. EXDEV yields ErrorCode::CrossDevice.
[[nodiscard]] auto hard_link(const std::filesystem::path& src,
                             const std::filesystem::path& dst) -> infra::VoidResult;

/// Symbolic link at `link` storing `target` verbatim.
[[nodiscard]] auto symbolic_link(const std::filesystem::path& target,
                                 const std::filesystem::path& link) -> infra::VoidResult;

/// Copy-on-write clone. Never falls back to a byte copy: filesystems without
/// clone support yield ErrorCode::UnsupportedOperation and leave nothing behind.
[[nodiscard]] auto reflink(const std::filesystem::path& src,
                           const std::filesystem::path& dst) -> infra::VoidResult;

[[nodiscard]] auto device_of(const std::filesystem::path& path) -> infra::Result<dev_t>;

/// `path` itself if it exists, otherwise its closest existing ancestor.
[[nodiscard]] auto nearest_existing_ancestor(const std::filesystem::path& path) -> std::filesystem::path;

/// Creates missing parent directories of `path`; existing ones are fine.
[[nodiscard]] auto ensure_parent_dirs(const std::filesystem::path& path) -> infra::VoidResult;

/// Unlinks a non-directory entry at `path` (no-op if absent). A directory
/// yields ErrorCode::DestinationConflict.
[[nodiscard]] auto remove_non_directory(const std::filesystem::path& path) -> infra::VoidResult;

/// True if anything, including a dangling symlink, exists at `path`.
[[nodiscard]] auto entry_exists(const std::filesystem::path& path) -> bool;

} // namespace pcopy::adapters::fs
