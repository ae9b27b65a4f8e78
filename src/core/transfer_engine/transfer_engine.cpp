#include "transfer_engine.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <fmt/core.h>
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/hash/checksum.hpp"
#include "../scanner/size_scanner.hpp"

namespace smartmig::core {

auto to_string(Phase phase) -> std::string_view {
    switch (phase) {
        case Phase::Initializing:          return "initializing";
        case Phase::Scanning:              return "scanning";
        case Phase::Copying:               return "copying";
        case Phase::Finalizing:            return "finalizing";
        case Phase::Completed:             return "completed";
        case Phase::CompletedWithFailures: return "completed with failures";
    }
    return "unknown";
}

TransferEngine::TransferEngine(const infra::Config& config,
                               infra::ProgressMonitor& monitor,
                               std::shared_ptr<spdlog::logger> logger,
                               infra::InterruptCheck interrupted)
    : config_(config)
    , monitor_(monitor)
    , logger_(std::move(logger))
    , interrupted_(std::move(interrupted))
    , filter_(config.exclude_patterns, config.include_patterns)
    , checkpoint_(config.checkpoint_path())
    , checkpoint_abs_(normalize_job_path(config.checkpoint_path()))
    , checkpoint_tmp_abs_(checkpoint_abs_.string() + ".tmp")
{
    if (!interrupted_) {
        interrupted_ = [] { return false; };
    }
}

bool TransferEngine::is_excluded(const std::filesystem::path& relative) const {
    // Never copy our own checkpoint when it lives inside the source tree.
    if (!source_root_.empty()) {
        const auto candidate = (source_root_ / relative).lexically_normal();
        if (candidate == checkpoint_abs_ || candidate == checkpoint_tmp_abs_) {
            return true;
        }
    }
    return filter_.should_exclude(relative);
}

auto TransferEngine::migrate(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             bool resume,
                             bool verify)
    -> infra::Result<RunStatus>
{
    state_ = MigrationState{};
    copied_this_run_ = 0;
    enter(Phase::Initializing);

    const auto src = normalize_job_path(source);
    const auto dst = normalize_job_path(destination);
    // The source directory is nested under the destination, never flattened.
    const auto actual_destination = dst / src.filename();

    if (auto valid = validate(src, actual_destination); !valid) {
        return std::unexpected(infra::log_and_return(*logger_, std::move(valid.error())));
    }
    source_root_ = src;

    std::optional<MigrationState> previous;
    if (resume) {
        auto loaded = load_resumable_state(src, dst);
        if (!loaded) {
            return std::unexpected(infra::log_and_return(*logger_, std::move(loaded.error())));
        }
        previous = std::move(*loaded);
    }

    if (previous) {
        state_ = std::move(*previous);
        // Failures of the earlier run are retried from scratch.
        state_.failed_files.clear();
        logger_->info("Resuming migration: {} files ({} bytes) already copied",
                      state_.copied_files.size(), state_.copied_size);
    } else {
        start_fresh(src, dst);
    }

    enter(Phase::Copying);
    const auto pending = collect_pending(src, actual_destination);

    monitor_.set_total(state_.copied_files.size() + pending.size(), state_.total_size);
    monitor_.set_initial(state_.copied_files.size(), state_.copied_size);

    if (pending.empty()) {
        logger_->info("All files already copied");
        checkpoint_.cleanup();
        enter(Phase::Completed);
        return RunStatus::Completed;
    }

    logger_->info("Copying {} files into {}", pending.size(), actual_destination.string());
    if (auto copied = copy_pending(pending, verify); !copied) {
        return std::unexpected(std::move(copied.error()));
    }

    return finalize();
}

auto TransferEngine::validate(const std::filesystem::path& source,
                              const std::filesystem::path& actual_destination) const
    -> infra::VoidResult
{
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
            fmt::format("Source directory {} does not exist", source.string())));
    }
    if (!std::filesystem::is_directory(source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
            fmt::format("Source {} is not a directory", source.string())));
    }

    // A destination inside the source would be copied into itself on resume.
    const auto rel = actual_destination.lexically_relative(source);
    if (!rel.empty() && *rel.begin() != "..") {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidDestination,
            fmt::format("Destination {} lies inside the source {}",
                        actual_destination.string(), source.string())));
    }
    return {};
}

auto TransferEngine::load_resumable_state(const std::filesystem::path& source,
                                          const std::filesystem::path& destination)
    -> infra::Result<std::optional<MigrationState>>
{
    auto loaded = checkpoint_.load();
    if (!loaded) {
        return std::unexpected(std::move(loaded.error()));
    }
    if (!*loaded) {
        logger_->info("No saved migration state at {}, starting fresh", checkpoint_.file().string());
        return std::optional<MigrationState>{};
    }
    if (!(*loaded)->matches(source, destination)) {
        logger_->warn("Previous migration state doesn't match current paths ({} -> {}), starting fresh",
                      (*loaded)->source_path.string(), (*loaded)->destination_path.string());
        return std::optional<MigrationState>{};
    }
    return loaded;
}

void TransferEngine::start_fresh(const std::filesystem::path& source,
                                 const std::filesystem::path& destination)
{
    enter(Phase::Scanning);

    state_.source_path = source;
    state_.destination_path = destination;
    state_.start_time = std::chrono::system_clock::now();
    state_.total_size = scan_tree(source, [this](const std::filesystem::path& rel) {
        return is_excluded(rel);
    }, *logger_).total_bytes;

    logger_->info("Total size: {} bytes", state_.total_size);
}

auto TransferEngine::collect_pending(const std::filesystem::path& source,
                                     const std::filesystem::path& actual_destination) const
    -> std::vector<PendingFile>
{
    std::vector<PendingFile> pending;
    std::vector<std::string> warnings;

    walk_files(source, [this](const std::filesystem::path& rel) {
        return is_excluded(rel);
    }, [&](ScannedFile&& file) {
        auto key = file.relative.generic_string();
        if (state_.is_copied(key)) {
            return;
        }
        pending.push_back(PendingFile{
            std::move(file.absolute),
            actual_destination / file.relative,
            std::move(key)
        });
    }, warnings);

    for (const auto& warning : warnings) {
        logger_->warn(warning);
    }
    return pending;
}

auto TransferEngine::copy_pending(const std::vector<PendingFile>& pending, bool verify)
    -> infra::VoidResult
{
    const auto interval = std::max<std::uint32_t>(
        1, config_.checkpoint_interval.value_or(infra::default_checkpoint_interval));

    for (const auto& file : pending) {
        if (interrupted_()) {
            return std::unexpected(save_on_interrupt());
        }

        auto copied = transfer_file(file, verify);
        if (!copied) {
            if (copied.error().code == infra::ErrorCode::Interrupted) {
                return std::unexpected(save_on_interrupt());
            }
            logger_->error("Failed to copy {} to {}: {}",
                           file.source.string(), file.destination.string(), copied.error().message);
            state_.record_failed(file.relative, copied.error().message);
            monitor_.update(1, 0);
            continue;
        }

        state_.record_copied(file.relative, *copied);
        ++copied_this_run_;
        monitor_.update(1, *copied);
        logger_->debug("Copied {} ({} bytes)", file.relative, *copied);

        if (copied_this_run_ % interval == 0) {
            if (auto saved = checkpoint_.save(state_); !saved) {
                return std::unexpected(infra::log_and_return(*logger_, std::move(saved.error())));
            }
            logger_->debug("Checkpoint saved after {} files", copied_this_run_);
        }
    }
    return {};
}

auto TransferEngine::transfer_file(const PendingFile& file, bool verify)
    -> infra::Result<std::uintmax_t>
{
    if (auto prepared = adapters::fs::prepare_destination(file.destination); !prepared) {
        return std::unexpected(std::move(prepared.error()));
    }

    auto written = adapters::fs::copy_file_chunked(
        file.source, file.destination,
        config_.chunk_size.value_or(infra::default_chunk_size),
        interrupted_);
    if (!written) {
        return std::unexpected(std::move(written.error()));
    }

    if (auto meta = extensions::copy_metadata(file.source, file.destination); !meta) {
        logger_->warn("Failed to copy metadata for {}: {}", file.source.string(), meta.error().message);
    }

    if (verify) {
        const auto algorithm = config_.hash_algorithm.value_or(infra::HashAlgorithm::XXH64);
        if (!infra::Checksum::verify_copy(file.source, file.destination, algorithm)) {
            logger_->warn("Hash mismatch for {}", file.source.string());
            return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("{} digest mismatch after copy", infra::to_string(algorithm))));
        }
    }

    return *written;
}

auto TransferEngine::save_on_interrupt() -> infra::Error {
    logger_->warn("Migration interrupted, saving progress ({} files copied)", state_.copied_files.size());
    if (auto saved = checkpoint_.save(state_); !saved) {
        (void)infra::log_and_return(*logger_, std::move(saved.error()));
    }
    return infra::make_error(infra::ErrorCode::Interrupted, "Migration interrupted by user");
}

auto TransferEngine::finalize() -> infra::Result<RunStatus> {
    enter(Phase::Finalizing);

    if (auto saved = checkpoint_.save(state_); !saved) {
        return std::unexpected(infra::log_and_return(*logger_, std::move(saved.error())));
    }

    if (state_.failed_files.empty()) {
        checkpoint_.cleanup();
        enter(Phase::Completed);
        return RunStatus::Completed;
    }

    logger_->warn("{} files failed; state kept in {} for --resume",
                  state_.failed_files.size(), checkpoint_.file().string());
    enter(Phase::CompletedWithFailures);
    return RunStatus::CompletedWithFailures;
}

void TransferEngine::enter(Phase phase) {
    phase_ = phase;
    logger_->debug("Migration phase: {}", to_string(phase));
}

} // namespace smartmig::core
