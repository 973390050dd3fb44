#pragma once

#include <cstddef>
#include <filesystem>
#include <expected>
#include <span>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace pcopy::infra {

// Incremental XXH64 digest; feed it the chunks a copy loop already holds.
class StreamingHasher {
public:
    StreamingHasher();
    ~StreamingHasher();

    StreamingHasher(const StreamingHasher&) = delete;
    StreamingHasher& operator=(const StreamingHasher&) = delete;

    void update(std::span<const char> data);
    [[nodiscard]] auto digest() const -> XXH64_hash_t;

private:
    XXH64_state_t* state_;
};

class XXHashVerifier {
public:
    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer

    // xxHash64 of a whole file
    static auto hash_file(const std::filesystem::path& path,
                          std::size_t chunk_size = BUFFER_SIZE)
        -> Result<XXH64_hash_t>;

    // Reads `dst` back in full and compares it against a digest taken from the source
    static auto verify_against(XXH64_hash_t expected,
                               const std::filesystem::path& dst,
                               std::size_t chunk_size = BUFFER_SIZE)
        -> Result<bool>;

    // Hashes both files and compares them
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> Result<bool>;
};

} // namespace pcopy::infra
