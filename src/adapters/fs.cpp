#include "fs.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../infra/interrupt.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
    #include <linux/fs.h>
    #include <liburing.h>
#endif

#ifdef __APPLE__
    #include <sys/attr.h>
    #include <sys/clonefile.h>
#endif

namespace pcopy::adapters::fs {

using infra::ErrorCode;
using infra::make_error;
using infra::make_system_error;

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

infra::VoidResult UniqueFd::close() {
    if (fd_ < 0) {
        return {};
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0 && errno != EINTR) {
        return std::unexpected(make_system_error(ErrorCode::IoFailure, "close",
                                                 fmt::format("fd {}", fd), errno));
    }
    return {};
}

auto select_strategy(std::uint64_t file_size) -> CopyStrategy {
    return file_size >= URING_THRESHOLD ? CopyStrategy::Uring : CopyStrategy::Buffered;
}

namespace {

auto write_all(int fd, const char* data, std::size_t size) -> infra::VoidResult {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(make_system_error(ErrorCode::IoFailure, "write",
                                                     fmt::format("fd {}", fd), errno));
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

auto interrupted_error() -> infra::Error {
    return make_error(ErrorCode::Interrupted, "Interrupted during copy");
}

// =============== Buffered I/O ===============
auto stream_buffered(int src_fd, int dst_fd, std::size_t chunk_size,
                     const ChunkCallback& on_chunk) -> infra::Result<std::uint64_t>
{
    std::vector<char> buffer(chunk_size);
    std::uint64_t total = 0;

    while (true) {
        if (infra::is_interrupted()) {
            return std::unexpected(interrupted_error());
        }

        // Fill a whole chunk so progress and hashing see uniform pieces
        std::size_t filled = 0;
        while (filled < chunk_size) {
            const ssize_t n = ::read(src_fd, buffer.data() + filled, chunk_size - filled);
            if (n < 0) {
                if (errno == EINTR) continue;
                return std::unexpected(make_system_error(ErrorCode::IoFailure, "read",
                                                         fmt::format("fd {}", src_fd), errno));
            }
            if (n == 0) break;
            filled += static_cast<std::size_t>(n);
        }
        if (filled == 0) break;

        if (auto res = write_all(dst_fd, buffer.data(), filled); !res) {
            return std::unexpected(std::move(res.error()));
        }
        total += filled;
        if (on_chunk) on_chunk({buffer.data(), filled});
        if (filled < chunk_size) break;
    }
    return total;
}

#ifdef __linux__
// =============== io_uring ===============
constexpr unsigned RING_SIZE = 8;

auto uring_complete(io_uring& ring) -> int {
    if (int rc = io_uring_submit_and_wait(&ring, 1); rc < 0) {
        return rc;
    }
    io_uring_cqe* cqe = nullptr;
    if (int rc = io_uring_wait_cqe(&ring, &cqe); rc < 0) {
        return rc;
    }
    const int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    return res;
}

auto stream_uring(int src_fd, int dst_fd, std::size_t chunk_size,
                  const ChunkCallback& on_chunk) -> infra::Result<std::uint64_t>
{
    io_uring ring;
    if (int rc = io_uring_queue_init(RING_SIZE, &ring, 0); rc < 0) {
        spdlog::debug("io_uring unavailable ({}), using buffered copy",
                      std::generic_category().message(-rc));
        return stream_buffered(src_fd, dst_fd, chunk_size, on_chunk);
    }
    struct RingGuard {
        io_uring& ring;
        ~RingGuard() { io_uring_queue_exit(&ring); }
    } guard{ring};

    std::vector<char> buffer(chunk_size);
    std::uint64_t offset = 0;

    while (true) {
        if (infra::is_interrupted()) {
            return std::unexpected(interrupted_error());
        }

        std::size_t filled = 0;
        while (filled < chunk_size) {
            io_uring_sqe* sqe = io_uring_get_sqe(&ring);
            io_uring_prep_read(sqe, src_fd, buffer.data() + filled,
                               static_cast<unsigned>(chunk_size - filled), offset + filled);
            const int res = uring_complete(ring);
            if (res == -EINTR || res == -EAGAIN) continue;
            if (res < 0) {
                return std::unexpected(make_system_error(ErrorCode::IoFailure, "read",
                                                         fmt::format("fd {}", src_fd), -res));
            }
            if (res == 0) break;
            filled += static_cast<std::size_t>(res);
        }
        if (filled == 0) break;

        std::size_t written = 0;
        while (written < filled) {
            io_uring_sqe* sqe = io_uring_get_sqe(&ring);
            io_uring_prep_write(sqe, dst_fd, buffer.data() + written,
                                static_cast<unsigned>(filled - written), offset + written);
            const int res = uring_complete(ring);
            if (res == -EINTR || res == -EAGAIN) continue;
            if (res <= 0) {
                return std::unexpected(make_system_error(ErrorCode::IoFailure, "write",
                                                         fmt::format("fd {}", dst_fd),
                                                         res == 0 ? EIO : -res));
            }
            written += static_cast<std::size_t>(res);
        }

        offset += filled;
        if (on_chunk) on_chunk({buffer.data(), filled});
        if (filled < chunk_size) break;
    }
    return offset;
}
#endif

auto map_create_errno(int err) -> ErrorCode {
    switch (err) {
        case EEXIST: return ErrorCode::AlreadyExists;
        case EISDIR:
        case ENOTDIR: return ErrorCode::DestinationConflict;
        default: return ErrorCode::IoFailure;
    }
}

} // namespace

auto stream_copy(int src_fd, int dst_fd, std::size_t chunk_size,
                 CopyStrategy strategy, const ChunkCallback& on_chunk)
    -> infra::Result<std::uint64_t>
{
#ifdef __linux__
    if (strategy == CopyStrategy::Uring) {
        return stream_uring(src_fd, dst_fd, chunk_size, on_chunk);
    }
#else
    (void)strategy;
#endif
    return stream_buffered(src_fd, dst_fd, chunk_size, on_chunk);
}

auto open_for_read(const std::filesystem::path& path) -> infra::Result<UniqueFd> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(make_system_error(ErrorCode::IoFailure, "open", path.string(), errno));
    }
    return UniqueFd{fd};
}

auto create_exclusive(const std::filesystem::path& path) -> infra::Result<UniqueFd> {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) {
        const int err = errno;
        return std::unexpected(make_system_error(map_create_errno(err), "create", path.string(), err));
    }
    return UniqueFd{fd};
}

auto hard_link(const std::filesystem::path& src, const std::filesystem::path& dst)
    -> infra::VoidResult
{
    if (::link(src.c_str(), dst.c_str()) != 0) {
        const int err = errno;
        const auto code = err == EXDEV ? ErrorCode::CrossDevice : map_create_errno(err);
        return std::unexpected(make_system_error(code, "link", dst.string(), err));
    }
    return {};
}

auto symbolic_link(const std::filesystem::path& target, const std::filesystem::path& link)
    -> infra::VoidResult
{
    if (::symlink(target.c_str(), link.c_str()) != 0) {
        const int err = errno;
        return std::unexpected(make_system_error(map_create_errno(err), "symlink", link.string(), err));
    }
    return {};
}

auto reflink(const std::filesystem::path& src, const std::filesystem::path& dst)
    -> infra::VoidResult
{
#if defined(__linux__)
    auto src_fd = open_for_read(src);
    if (!src_fd) {
        return std::unexpected(std::move(src_fd.error()));
    }
    auto dst_fd = create_exclusive(dst);
    if (!dst_fd) {
        return std::unexpected(std::move(dst_fd.error()));
    }
    if (::ioctl(dst_fd->get(), FICLONE, src_fd->get()) != 0) {
        const int err = errno;
        dst_fd->reset();
        ::unlink(dst.c_str());
        const bool unsupported = err == EOPNOTSUPP || err == EINVAL || err == EXDEV
                              || err == ENOTTY || err == ENOSYS;
        return std::unexpected(make_system_error(
            unsupported ? ErrorCode::UnsupportedOperation : ErrorCode::IoFailure,
            "reflink", dst.string(), err));
    }
    return dst_fd->close();
#elif defined(__APPLE__)
    if (::clonefile(src.c_str(), dst.c_str(), CLONE_NOFOLLOW | CLONE_NOOWNERCOPY) != 0) {
        const int err = errno;
        const bool unsupported = err == ENOTSUP || err == EXDEV;
        return std::unexpected(make_system_error(
            unsupported ? ErrorCode::UnsupportedOperation : map_create_errno(err),
            "clonefile", dst.string(), err));
    }
    return {};
#else
    (void)src;
    return std::unexpected(make_error(ErrorCode::UnsupportedOperation,
                                      fmt::format("reflink '{}': not supported on this platform",
                                                  dst.string())));
#endif
}

auto device_of(const std::filesystem::path& path) -> infra::Result<dev_t> {
    struct stat sb;
    if (::stat(path.c_str(), &sb) != 0) {
        return std::unexpected(make_system_error(ErrorCode::IoFailure, "stat", path.string(), errno));
    }
    return sb.st_dev;
}

auto nearest_existing_ancestor(const std::filesystem::path& path) -> std::filesystem::path {
    auto current = path;
    std::error_code ec;
    while (!current.empty() && !std::filesystem::exists(current, ec)) {
        auto parent = current.parent_path();
        if (parent == current) break;
        current = std::move(parent);
    }
    return current;
}

auto ensure_parent_dirs(const std::filesystem::path& path) -> infra::VoidResult {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        const auto code = ec == std::errc::file_exists || ec == std::errc::not_a_directory
                              ? ErrorCode::DestinationConflict
                              : ErrorCode::IoFailure;
        return std::unexpected(make_system_error(code, "create directory", parent.string(), ec.value()));
    }
    return {};
}

auto remove_non_directory(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return {};
    }
    if (std::filesystem::is_directory(status)) {
        return std::unexpected(make_error(ErrorCode::DestinationConflict,
            fmt::format("'{}' is a directory and cannot be overwritten", path.string())));
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return std::unexpected(make_system_error(ErrorCode::IoFailure, "unlink", path.string(), errno));
    }
    return {};
}

auto entry_exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

} // namespace pcopy::adapters::fs
