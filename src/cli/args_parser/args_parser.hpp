#pragma once

#include <string>
#include <vector>
#include <optional>

namespace smartmig::args_parser {

struct CLIArgs
{
    std::string source;                     // positional
    std::string destination;                // positional
    bool resume{false};                     // --resume
    bool verify{false};                     // --verify
    bool verbose{false};                    // -v, --verbose
    bool quiet{false};                      // -q, --quiet
    bool progress{true};                    // --no-progress
    std::optional<std::string> config_file; // --config=FILE
    std::optional<std::string> state_file;  // --state-file=FILE
    std::optional<std::string> log_file;    // --log-file=FILE ("" disables)
    std::optional<std::string> hash;        // --hash=xxh32|xxh64|xxh3
    std::vector<std::string> exclude;       // --exclude TOKEN (repeatable)
    std::vector<std::string> include;       // --include TOKEN (repeatable)
};

/// Parses command-line arguments. Returns nullopt after printing help,
/// version or a usage error; `exit_code` then holds the status to exit with.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace smartmig::args_parser
