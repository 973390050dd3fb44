#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace pcopy::args_parser {

namespace {

void print_version() {
    constexpr auto git = build_info::get_git_info();
    fmt::print("pcopy {}\n", git.commit_short);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    std::vector<std::string> paths;
    bool version = false;

    CLI::App app{"Copies files or directories, optionally as hard links, symbolic links or reflinks."};
    // Not required at the CLI11 level so --version works without paths
    app.add_option("paths", paths, "SOURCE... DEST");

    app.add_flag("-f,--force", args.force, "Overwrite destination if it exists");
    auto* hard = app.add_flag("--hard-link", args.hard_link, "Hard link files instead of copying");
    auto* sym = app.add_flag("--symlink", args.symlink, "Symbolically link files instead of copying");
    auto* ref = app.add_flag("--reflink", args.reflink, "Clone files copy-on-write (fails where unsupported)");
    hard->excludes(sym)->excludes(ref);
    sym->excludes(ref);

    app.add_flag("--verify", args.verify, "Verify content hash of every copied file");
    app.add_flag("--no-progress", args.no_progress, "Disable progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");
    auto* no_awake = app.add_flag("--no-keep-awake", args.no_keep_awake,
                                  "Do not keep the system awake while copying");
    app.add_flag("--keep-display-awake", args.keep_display_awake,
                 "Keep the display awake too while copying")->excludes(no_awake);
    app.add_flag("--preserve-metadata", args.preserve_metadata,
                 "Copy permission bits and modification times");
    app.add_option("-j,--threads", args.threads, "Number of worker threads")
        ->check(CLI::PositiveNumber);
    app.add_option("--buffer-size", args.buffer_size, "Copy chunk size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", args.log_level, "trace, debug, info, warn, error, critical, off");
    app.add_flag("--version", version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help exits 0; usage errors use the "aborted before starting" status
        exit_code = app.exit(e) == 0 ? 0 : 2;
        return std::nullopt;
    }

    if (version) {
        print_version();
        exit_code = 0;
        return std::nullopt;
    }
    if (paths.size() < 2) {
        fmt::print(stderr, "{}\nAt least one SOURCE and a DEST are required\n", app.help());
        exit_code = 2;
        return std::nullopt;
    }

    args.destination = paths.back();
    paths.pop_back();
    args.sources = std::move(paths);
    return args;
}

} // namespace pcopy::args_parser
