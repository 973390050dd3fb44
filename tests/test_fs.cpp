#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "adapters/fs.hpp"
#include "infra/interrupt.hpp"
#include "test_utils.hpp"

namespace fs = pcopy::adapters::fs;

using pcopy::infra::ErrorCode;
using pcopy::test_utils::TempDir;
using pcopy::test_utils::random_bytes;
using pcopy::test_utils::read_file;
using pcopy::test_utils::write_file;

namespace {

constexpr std::size_t CHUNK = 64 * 1024;

struct StreamOutcome {
    pcopy::infra::Result<std::uint64_t> copied;
    std::vector<std::size_t> chunks;
};

StreamOutcome stream_file(const std::filesystem::path& src, const std::filesystem::path& dst,
                          fs::CopyStrategy strategy) {
    auto in = fs::open_for_read(src);
    auto out = fs::create_exclusive(dst);
    EXPECT_TRUE(in && out);

    StreamOutcome outcome{.copied = 0u, .chunks = {}};
    outcome.copied = fs::stream_copy(in->get(), out->get(), CHUNK, strategy,
        [&](std::span<const char> chunk) { outcome.chunks.push_back(chunk.size()); });
    EXPECT_TRUE(out->close());
    return outcome;
}

} // namespace

class StreamCopyTest : public ::testing::Test {
protected:
    void SetUp() override {
        pcopy::infra::reset_interrupt();
        data = random_bytes(CHUNK * 3 + 123, 11);
        write_file(tmp / "src.bin", data);
    }

    void TearDown() override {
        pcopy::infra::reset_interrupt();
    }

    TempDir tmp;
    std::string data;
};

TEST_F(StreamCopyTest, UringCopiesPartialTrailingChunk)
{
    auto outcome = stream_file(tmp / "src.bin", tmp / "dst.bin", fs::CopyStrategy::Uring);

    ASSERT_TRUE(outcome.copied) << outcome.copied.error().message;
    EXPECT_EQ(*outcome.copied, data.size());
    EXPECT_EQ(read_file(tmp / "dst.bin"), data);
    EXPECT_EQ(outcome.chunks, (std::vector<std::size_t>{CHUNK, CHUNK, CHUNK, 123}));
}

TEST_F(StreamCopyTest, BufferedCopiesPartialTrailingChunk)
{
    auto outcome = stream_file(tmp / "src.bin", tmp / "dst.bin", fs::CopyStrategy::Buffered);

    ASSERT_TRUE(outcome.copied) << outcome.copied.error().message;
    EXPECT_EQ(*outcome.copied, data.size());
    EXPECT_EQ(read_file(tmp / "dst.bin"), data);
    EXPECT_EQ(outcome.chunks, (std::vector<std::size_t>{CHUNK, CHUNK, CHUNK, 123}));
}

TEST_F(StreamCopyTest, UringExactMultipleEndsWithoutEmptyChunk)
{
    const auto exact = random_bytes(CHUNK * 2, 12);
    write_file(tmp / "exact.bin", exact);

    auto outcome = stream_file(tmp / "exact.bin", tmp / "dst.bin", fs::CopyStrategy::Uring);

    ASSERT_TRUE(outcome.copied);
    EXPECT_EQ(*outcome.copied, exact.size());
    EXPECT_EQ(read_file(tmp / "dst.bin"), exact);
    EXPECT_EQ(outcome.chunks, (std::vector<std::size_t>{CHUNK, CHUNK}));
}

TEST_F(StreamCopyTest, InterruptStopsBeforeFirstChunk)
{
    pcopy::infra::request_interrupt();
    auto outcome = stream_file(tmp / "src.bin", tmp / "dst.bin", fs::CopyStrategy::Uring);

    ASSERT_FALSE(outcome.copied);
    EXPECT_EQ(outcome.copied.error().code, ErrorCode::Interrupted);
    EXPECT_TRUE(outcome.chunks.empty());
}

TEST(FsTest, SelectStrategyUsesUringForLargeFilesOnly)
{
    EXPECT_EQ(fs::select_strategy(1024), fs::CopyStrategy::Buffered);
    EXPECT_EQ(fs::select_strategy(fs::URING_THRESHOLD), fs::CopyStrategy::Uring);
}

TEST(FsTest, CreateExclusiveRefusesExistingEntry)
{
    TempDir tmp;
    write_file(tmp / "taken", "x");

    auto fd = fs::create_exclusive(tmp / "taken");
    ASSERT_FALSE(fd);
    EXPECT_EQ(fd.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(read_file(tmp / "taken"), "x");
}

TEST(FsTest, RemoveNonDirectoryKeepsDirectories)
{
    TempDir tmp;
    write_file(tmp / "file", "x");
    std::filesystem::create_directories(tmp / "dir");
    std::filesystem::create_symlink("/nonexistent/target", tmp / "dangling");

    EXPECT_TRUE(fs::entry_exists(tmp / "dangling"));
    EXPECT_TRUE(fs::remove_non_directory(tmp / "file"));
    EXPECT_TRUE(fs::remove_non_directory(tmp / "dangling"));
    EXPECT_TRUE(fs::remove_non_directory(tmp / "absent"));
    EXPECT_FALSE(fs::entry_exists(tmp / "file"));
    EXPECT_FALSE(fs::entry_exists(tmp / "dangling"));

    auto res = fs::remove_non_directory(tmp / "dir");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DestinationConflict);
    EXPECT_TRUE(std::filesystem::is_directory(tmp / "dir"));
}

TEST(FsTest, NearestExistingAncestorWalksUp)
{
    TempDir tmp;
    std::filesystem::create_directories(tmp / "a");
    EXPECT_EQ(fs::nearest_existing_ancestor(tmp / "a" / "b" / "c"), tmp / "a");
    EXPECT_EQ(fs::nearest_existing_ancestor(tmp / "a"), tmp / "a");
}
