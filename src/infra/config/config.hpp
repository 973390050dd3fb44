#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <spdlog/common.h>
#include "../error_handler/error.hpp"
#include "../awake/awake_guard.hpp"
#include "../../core/transfer/transfer.hpp"

namespace pcopy::args_parser {
    struct CLIArgs;
}

namespace pcopy::infra {

inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;   // 4 MiB
inline constexpr std::size_t MAX_CHUNK_SIZE = 1024 * 1024 * 1024;    // 1 GiB

struct Config {
    // I/O
    std::optional<std::uint32_t> threads;
    std::optional<std::size_t> buffer_size;   // bytes per chunk

    // Behavior
    core::TransferMode mode = core::TransferMode::Copy;
    bool force = false;
    bool verify = false;
    bool progress = true;
    bool quiet = false;
    bool preserve_metadata = false;
    AwakeScope awake = AwakeScope::System;

    // Logging
    std::optional<std::string> log_level;

    // Values set in `other` take priority (CLI over file)
    void merge_with(const Config& other);

    [[nodiscard]] auto validate() const -> VoidResult;

    [[nodiscard]] auto chunk_size() const -> std::size_t {
        return buffer_size.value_or(DEFAULT_CHUNK_SIZE);
    }
    [[nodiscard]] auto worker_count() const -> std::uint32_t;
};

[[nodiscard]] auto parse_mode(std::string_view text) -> std::optional<core::TransferMode>;
[[nodiscard]] auto parse_awake_scope(std::string_view text) -> std::optional<AwakeScope>;
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<spdlog::level::level_enum>;

/// Applies the file level, then SPDLOG_LEVEL, then the CLI level.
/// Both names are checked first; on error the current level is left as is.
[[nodiscard]] auto apply_log_levels(const Config& file_config, const Config& cli_config) -> VoidResult;

/// Loads the YAML configuration. Search order:
///   1. ./.pcopy.yaml
///   2. $XDG_CONFIG_HOME/pcopy/config.yaml or ~/.config/pcopy/config.yaml
///   3. %APPDATA%/pcopy/config.yaml (Windows)
/// Returns a default Config when no file exists.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Parses one explicit YAML file.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace pcopy::infra
