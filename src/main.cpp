#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logging.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>

using ARGS = smartmig::args_parser::CLIArgs;

static void print_banner(const ARGS& args) {
    fmt::print("Smart File Migration Tool {}\n", smartmig::build_info::version);
    fmt::print("Source: {}\n", args.source);
    fmt::print("Destination: {}\n", args.destination);
    fmt::print("Resume: {}\n", args.resume ? "Yes" : "No");
    fmt::print("Verify: {}\n\n", args.verify ? "Yes" : "No");
}

static void print_results(const smartmig::core::MigrationState& state) {
    const auto copied = state.copied_files.size();
    const auto failed = state.failed_files.size();
    const auto total = copied + failed;
    const double success_rate = total > 0 ? static_cast<double>(copied) / static_cast<double>(total) * 100.0 : 0.0;

    fmt::print("Migration Results\n");
    fmt::print("  {:<20} {}\n", "Total Files", total);
    fmt::print("  {:<20} {}\n", "Copied Successfully", copied);
    fmt::print("  {:<20} {}\n", "Failed", failed);
    fmt::print("  {:<20} {:.1f}%\n", "Success Rate", success_rate);
    fmt::print("  {:<20} {} bytes\n", "Total Size", state.total_size);
    fmt::print("  {:<20} {} bytes\n", "Copied Size", state.copied_size);

    if (state.start_time != std::chrono::system_clock::time_point{}) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - state.start_time).count();
        fmt::print("  {:<20} {:02}:{:02}:{:02}\n", "Duration",
                   elapsed / 3600, (elapsed % 3600) / 60, elapsed % 60);
    }

    if (!state.failed_files.empty()) {
        fmt::print("\nFailed files:\n");
        for (const auto& [path, reason] : state.failed_files) {
            fmt::print("  {}: {}\n", path, reason);
        }
    }
}

int main(int argc, char** argv)
{
    try {
        smartmig::infra::install_signal_handler();

        int parse_status = 0;
        auto args_opt = smartmig::args_parser::parse_args(argc, argv, parse_status);
        if (!args_opt) {
            return parse_status; // --help, --version or usage error
        }
        const auto& args = *args_opt;

        // 1. Config file
        auto config_res = args.config_file
            ? smartmig::infra::load_config(*args.config_file)
            : smartmig::infra::load_config_from_file();
        if (!config_res) {
            fmt::print(stderr, "Config error: {}\n", config_res.error());
            return 1;
        }
        auto config = std::move(config_res.value());

        // 2. Command line wins
        config.merge_with(smartmig::infra::config_from_cli(args));

        auto logger = smartmig::infra::make_logger(smartmig::infra::LogOptions{
            .name = "smartmig",
            .file = config.log_path(),
            .verbose = config.verbose,
            .quiet = config.quiet,
        });
        logger->debug("Build {} ({})", smartmig::build_info::version, smartmig::build_info::git_commit_short);

        if (!config.quiet) {
            print_banner(args);
        }

        smartmig::infra::ProgressMonitor monitor(config.progress, config.quiet);
        smartmig::core::TransferEngine engine(config, monitor, logger);

        auto result = engine.migrate(args.source, args.destination, config.resume, config.verify);
        monitor.finish();

        if (!result) {
            if (result.error().code == smartmig::infra::ErrorCode::Interrupted) {
                fmt::print(stderr, "\nMigration interrupted by user\n");
                fmt::print(stderr, "You can resume later using --resume flag\n");
            } else {
                fmt::print(stderr, "Migration failed: {}\n", result.error().message);
            }
            logger->flush();
            return result.error().to_exit_code();
        }

        if (!config.quiet) {
            print_results(engine.state());
        }
        logger->flush();

        if (*result == smartmig::core::RunStatus::Completed) {
            if (!config.quiet) fmt::print("Migration completed successfully!\n");
            return 0;
        }
        fmt::print(stderr, "Migration completed with errors\n");
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
