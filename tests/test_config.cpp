#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_utils.hpp"

using pcopy::core::TransferMode;
using pcopy::infra::AwakeScope;
using pcopy::infra::Config;
using pcopy::infra::ErrorCode;
using pcopy::infra::load_config_from_file;
using pcopy::test_utils::TempDir;
using pcopy::test_utils::write_file;

TEST(ConfigTest, DefaultsAreSane)
{
    Config cfg;
    EXPECT_EQ(cfg.mode, TransferMode::Copy);
    EXPECT_FALSE(cfg.force);
    EXPECT_FALSE(cfg.verify);
    EXPECT_TRUE(cfg.progress);
    EXPECT_FALSE(cfg.preserve_metadata);
    EXPECT_EQ(cfg.awake, AwakeScope::System);
    EXPECT_EQ(cfg.chunk_size(), pcopy::infra::DEFAULT_CHUNK_SIZE);
    EXPECT_GE(cfg.worker_count(), 2u);
    EXPECT_TRUE(cfg.validate());
}

TEST(ConfigTest, LoadsYamlFile)
{
    TempDir tmp;
    write_file(tmp / "config.yaml",
               "threads: 3\n"
               "buffer_size: 1048576\n"
               "mode: hard-link\n"
               "verify: true\n"
               "progress: false\n"
               "awake: display\n"
               "log_level: debug\n");

    auto cfg = load_config_from_file(tmp / "config.yaml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg->threads, 3u);
    EXPECT_EQ(cfg->worker_count(), 3u);
    EXPECT_EQ(cfg->chunk_size(), 1048576u);
    EXPECT_EQ(cfg->mode, TransferMode::HardLink);
    EXPECT_TRUE(cfg->verify);
    EXPECT_FALSE(cfg->progress);
    EXPECT_EQ(cfg->awake, AwakeScope::DisplayOnly);
    EXPECT_EQ(cfg->log_level, "debug");
}

TEST(ConfigTest, UnknownModeIsInvalidArgument)
{
    TempDir tmp;
    write_file(tmp / "config.yaml", "mode: teleport\n");
    auto cfg = load_config_from_file(tmp / "config.yaml");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, MalformedYamlIsInvalidArgument)
{
    TempDir tmp;
    write_file(tmp / "config.yaml", "threads: [1, 2\n");
    auto cfg = load_config_from_file(tmp / "config.yaml");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, MetadataPreservationIsOptIn)
{
    TempDir tmp;
    write_file(tmp / "config.yaml", "preserve_metadata: true\n");
    auto file = load_config_from_file(tmp / "config.yaml");
    ASSERT_TRUE(file) << file.error().message;

    // A CLI run without --preserve-metadata keeps the file's choice
    file->merge_with(pcopy::infra::config_from_cli(pcopy::args_parser::CLIArgs{}));
    EXPECT_TRUE(file->preserve_metadata);

    Config plain;
    plain.merge_with(pcopy::infra::config_from_cli(pcopy::args_parser::CLIArgs{}));
    EXPECT_FALSE(plain.preserve_metadata);
}

TEST(ConfigTest, CliValuesOverrideFileValues)
{
    Config file;
    file.threads = 2;
    file.mode = TransferMode::SymLink;
    file.log_level = "warn";

    pcopy::args_parser::CLIArgs args;
    args.threads = 6;
    args.reflink = true;
    args.verify = true;
    args.no_keep_awake = true;
    args.preserve_metadata = true;

    file.merge_with(pcopy::infra::config_from_cli(args));
    EXPECT_EQ(file.threads, 6u);
    EXPECT_TRUE(file.preserve_metadata);
    EXPECT_EQ(file.mode, TransferMode::RefLink);
    EXPECT_TRUE(file.verify);
    EXPECT_EQ(file.awake, AwakeScope::Disabled);
    EXPECT_EQ(file.log_level, "warn");
}

TEST(ConfigTest, ValidateRejectsOutOfRangeValues)
{
    Config zero_threads;
    zero_threads.threads = 0;
    EXPECT_FALSE(zero_threads.validate());

    Config huge_buffer;
    huge_buffer.buffer_size = pcopy::infra::MAX_CHUNK_SIZE + 1;
    EXPECT_FALSE(huge_buffer.validate());

    Config bad_level;
    bad_level.log_level = "chatty";
    auto res = bad_level.validate();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, ParsesLogLevelNames)
{
    EXPECT_EQ(pcopy::infra::parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(pcopy::infra::parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(pcopy::infra::parse_log_level("chatty").has_value());
}

TEST(ConfigTest, UnknownLogLevelIsRejectedBeforeAnyLevelChange)
{
    spdlog::set_level(spdlog::level::info);
    Config file;
    Config cli;
    cli.log_level = "chatty";

    auto res = pcopy::infra::apply_log_levels(file, cli);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
    // Still able to report the error
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);

    cli.log_level = "debug";
    ASSERT_TRUE(pcopy::infra::apply_log_levels(file, cli));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    spdlog::set_level(spdlog::level::info);
}

TEST(ConfigTest, ParsesModeAndScopeNames)
{
    EXPECT_EQ(pcopy::infra::parse_mode("copy"), TransferMode::Copy);
    EXPECT_EQ(pcopy::infra::parse_mode("symlink"), TransferMode::SymLink);
    EXPECT_EQ(pcopy::infra::parse_mode("reflink"), TransferMode::RefLink);
    EXPECT_FALSE(pcopy::infra::parse_mode("move"));
    EXPECT_EQ(pcopy::infra::parse_awake_scope("off"), AwakeScope::Disabled);
    EXPECT_FALSE(pcopy::infra::parse_awake_scope("always"));
}
