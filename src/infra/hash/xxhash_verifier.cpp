#include "xxhash_verifier.hpp"
#include <fstream>
#include <new>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pcopy::infra {

StreamingHasher::StreamingHasher()
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_, 0); // seed = 0
}

StreamingHasher::~StreamingHasher() {
    XXH64_freeState(state_);
}

void StreamingHasher::update(std::span<const char> data) {
    XXH64_update(state_, data.data(), data.size());
}

XXH64_hash_t StreamingHasher::digest() const {
    return XXH64_digest(state_);
}

auto XXHashVerifier::hash_file(const std::filesystem::path& path, std::size_t chunk_size)
    -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    StreamingHasher hasher;
    std::vector<char> buffer(chunk_size);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        hasher.update({buffer.data(), static_cast<std::size_t>(file.gcount())});
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return hasher.digest();
}

auto XXHashVerifier::verify_against(XXH64_hash_t expected,
                                    const std::filesystem::path& dst,
                                    std::size_t chunk_size)
    -> Result<bool>
{
    auto dst_hash = hash_file(dst, chunk_size);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    const bool match = (expected == *dst_hash);
    if (match) {
        spdlog::debug("Hash ok: {} ({:016x})", dst.string(), *dst_hash);
    } else {
        spdlog::warn("Hash mismatch: {} (expected: {:016x}, got: {:016x})",
                     dst.string(), expected, *dst_hash);
    }
    return match;
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> Result<bool>
{
    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }
    return verify_against(*src_hash, dst);
}

} // namespace pcopy::infra
