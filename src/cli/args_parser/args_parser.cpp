#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <build_info.hpp>

namespace smartmig::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    CLI::App app{"Copies a project tree, skipping build output and dependency caches.\n"
                 "Interrupted runs can be continued with --resume."};
    app.set_version_flag("--version", std::string(build_info::version));

    app.add_option("source", args.source, "Source directory to migrate")
        ->required()
        ->check(CLI::ExistingDirectory);
    app.add_option("destination", args.destination, "Destination directory (the source is nested inside it)")
        ->required();

    app.add_flag("--resume", args.resume, "Resume from the saved migration state");
    app.add_flag("--verify", args.verify, "Verify file digests after copying (slower)");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");
    app.add_flag("!--no-progress", args.progress, "Disable the progress bar");

    app.add_option("--config", args.config_file, "Read settings from this YAML file")
        ->check(CLI::ExistingFile);
    app.add_option("--state-file", args.state_file, "Checkpoint file location");
    app.add_option("--log-file", args.log_file, "Append log records to this file (empty to disable)");
    app.add_option("--hash", args.hash, "Digest used by --verify")
        ->check(CLI::IsMember({"xxh32", "xxh64", "xxh3"}));
    app.add_option("--exclude", args.exclude, "Additional exclude token (repeatable)");
    app.add_option("--include", args.include, "Additional include token (repeatable)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    exit_code = 0;
    return args;
}

} // namespace smartmig::args_parser
