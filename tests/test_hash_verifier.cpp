#include <gtest/gtest.h>

#include <algorithm>

#include "infra/hash/xxhash_verifier.hpp"
#include "test_utils.hpp"

using pcopy::infra::ErrorCode;
using pcopy::infra::StreamingHasher;
using pcopy::infra::XXHashVerifier;
using pcopy::test_utils::TempDir;
using pcopy::test_utils::random_bytes;
using pcopy::test_utils::write_file;

TEST(XXHashVerifierTest, IdenticalFilesMatch)
{
    TempDir tmp;
    const auto data = random_bytes(1024 * 1024 + 3);
    write_file(tmp / "a", data);
    write_file(tmp / "b", data);

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_TRUE(res);
    EXPECT_TRUE(*res);
}

TEST(XXHashVerifierTest, SingleFlippedByteIsDetected)
{
    TempDir tmp;
    auto data = random_bytes(256 * 1024);
    write_file(tmp / "a", data);
    data[data.size() / 2] ^= 0x01;
    write_file(tmp / "b", data);

    auto res = XXHashVerifier::verify_files(tmp / "a", tmp / "b");
    ASSERT_TRUE(res);
    EXPECT_FALSE(*res);
}

TEST(XXHashVerifierTest, StreamingDigestIsIndependentOfChunking)
{
    TempDir tmp;
    const auto data = random_bytes(100'000);
    write_file(tmp / "a", data);

    StreamingHasher hasher;
    for (std::size_t off = 0; off < data.size(); off += 777) {
        const auto len = std::min<std::size_t>(777, data.size() - off);
        hasher.update({data.data() + off, len});
    }

    auto whole = XXHashVerifier::hash_file(tmp / "a", 4096);
    ASSERT_TRUE(whole);
    EXPECT_EQ(hasher.digest(), *whole);

    auto check = XXHashVerifier::verify_against(hasher.digest(), tmp / "a", 10'000);
    ASSERT_TRUE(check);
    EXPECT_TRUE(*check);
}

TEST(XXHashVerifierTest, EmptyFileHashesLikeEmptyStream)
{
    TempDir tmp;
    write_file(tmp / "empty", "");

    StreamingHasher hasher;
    auto res = XXHashVerifier::hash_file(tmp / "empty");
    ASSERT_TRUE(res);
    EXPECT_EQ(*res, hasher.digest());
}

TEST(XXHashVerifierTest, MissingFileIsIoFailure)
{
    TempDir tmp;
    auto res = XXHashVerifier::hash_file(tmp / "missing");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::IoFailure);
}
