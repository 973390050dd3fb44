#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>
#include <thread>

#ifdef _WIN32
    #include <shlobj.h>
    #include <knownfolders.h>
#endif

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace pcopy::infra {

void Config::merge_with(const Config& other) {
    if (other.threads) threads = other.threads;
    if (other.buffer_size) buffer_size = other.buffer_size;
    if (other.mode != core::TransferMode::Copy) mode = other.mode;
    if (other.force) force = true;
    if (other.verify) verify = true;
    if (!other.progress) progress = false;
    if (other.quiet) quiet = true;
    if (other.preserve_metadata) preserve_metadata = true;
    if (other.awake != AwakeScope::System) awake = other.awake;
    if (other.log_level) log_level = other.log_level;
}

VoidResult Config::validate() const {
    if (threads && *threads == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "threads must be at least 1"));
    }
    if (buffer_size && (*buffer_size == 0 || *buffer_size > MAX_CHUNK_SIZE)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            fmt::format("buffer_size must be between 1 and {} bytes", MAX_CHUNK_SIZE)));
    }
    if (log_level && !parse_log_level(*log_level)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            fmt::format("unknown log level '{}'", *log_level)));
    }
    return {};
}

std::uint32_t Config::worker_count() const {
    if (threads) return *threads;
    // I/O bound: a handful of workers saturates most devices
    return std::clamp<std::uint32_t>(std::thread::hardware_concurrency(), 2, 8);
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
    // from_str maps unknown names to off
    const std::string name(text);
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

VoidResult apply_log_levels(const Config& file_config, const Config& cli_config) {
    if (auto valid = file_config.validate(); !valid) {
        return valid;
    }
    if (auto valid = cli_config.validate(); !valid) {
        return valid;
    }
    if (file_config.log_level) {
        spdlog::set_level(*parse_log_level(*file_config.log_level));
    }
    spdlog::cfg::load_env_levels();
    if (cli_config.log_level) {
        spdlog::set_level(*parse_log_level(*cli_config.log_level));
    }
    return {};
}

std::optional<core::TransferMode> parse_mode(std::string_view text) {
    if (text == "copy") return core::TransferMode::Copy;
    if (text == "hard-link" || text == "hardlink") return core::TransferMode::HardLink;
    if (text == "symlink") return core::TransferMode::SymLink;
    if (text == "reflink") return core::TransferMode::RefLink;
    return std::nullopt;
}

std::optional<AwakeScope> parse_awake_scope(std::string_view text) {
    if (text == "disabled" || text == "off") return AwakeScope::Disabled;
    if (text == "display") return AwakeScope::DisplayOnly;
    if (text == "system") return AwakeScope::System;
    return std::nullopt;
}

static auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    paths.push_back(".pcopy.yaml");

#ifdef _WIN32
    PWSTR appdata_path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appdata_path))) {
        paths.push_back(std::filesystem::path(appdata_path) / "pcopy" / "config.yaml");
        CoTaskMemFree(appdata_path);
    }
#else
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "pcopy" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "pcopy" / "config.yaml");
        }
    }
#endif

    return paths;
}

Result<Config> load_config_from_file(const std::filesystem::path& path) {
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        Config cfg{};

        if (node["threads"]) cfg.threads = node["threads"].as<std::uint32_t>();
        if (node["buffer_size"]) cfg.buffer_size = node["buffer_size"].as<std::size_t>();

        if (node["mode"]) {
            const auto text = node["mode"].as<std::string>();
            auto mode = parse_mode(text);
            if (!mode) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    fmt::format("{}: unknown mode '{}'", path.string(), text)));
            }
            cfg.mode = *mode;
        }
        if (node["awake"]) {
            const auto text = node["awake"].as<std::string>();
            auto scope = parse_awake_scope(text);
            if (!scope) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    fmt::format("{}: unknown awake scope '{}'", path.string(), text)));
            }
            cfg.awake = *scope;
        }

        if (node["force"]) cfg.force = node["force"].as<bool>();
        if (node["verify"]) cfg.verify = node["verify"].as<bool>();
        if (node["progress"]) cfg.progress = node["progress"].as<bool>();
        if (node["quiet"]) cfg.quiet = node["quiet"].as<bool>();
        if (node["preserve_metadata"]) cfg.preserve_metadata = node["preserve_metadata"].as<bool>();
        if (node["log_level"]) cfg.log_level = node["log_level"].as<std::string>();

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            fmt::format("Failed to parse {}: {}", path.string(), e.what())));
    }
}

Result<Config> load_config_from_file() {
    for (const auto& path : get_config_paths()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        return load_config_from_file(path);
    }
    return Config{};
}

Config config_from_cli(const args_parser::CLIArgs& args) {
    Config cfg{};
    cfg.threads = args.threads;
    cfg.buffer_size = args.buffer_size;
    if (args.hard_link) cfg.mode = core::TransferMode::HardLink;
    if (args.symlink) cfg.mode = core::TransferMode::SymLink;
    if (args.reflink) cfg.mode = core::TransferMode::RefLink;
    cfg.force = args.force;
    cfg.verify = args.verify;
    cfg.progress = !args.no_progress;
    cfg.quiet = args.quiet;
    cfg.preserve_metadata = args.preserve_metadata;
    if (args.no_keep_awake) {
        cfg.awake = AwakeScope::Disabled;
    } else if (args.keep_display_awake) {
        cfg.awake = AwakeScope::DisplayOnly;
    }
    cfg.log_level = args.log_level;
    return cfg;
}

} // namespace pcopy::infra
