#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace pcopy::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;       // positional, all but the last
    std::string destination;                // last positional
    bool force{false};                      // -f, --force
    bool hard_link{false};                  // --hard-link
    bool symlink{false};                    // --symlink
    bool reflink{false};                    // --reflink
    bool verify{false};                     // --verify
    bool no_progress{false};                // --no-progress
    bool quiet{false};                      // -q, --quiet
    bool no_keep_awake{false};              // --no-keep-awake
    bool keep_display_awake{false};         // --keep-display-awake
    bool preserve_metadata{false};          // --preserve-metadata
    std::optional<std::uint32_t> threads;   // -j, --threads=N
    std::optional<std::size_t> buffer_size; // --buffer-size=BYTES
    std::optional<std::string> log_level;   // --log-level=LEVEL
};

/// Parses command-line arguments. Returns nullopt after --help, --version
/// or a usage error; `exit_code` then holds the status to exit with.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace pcopy::args_parser
