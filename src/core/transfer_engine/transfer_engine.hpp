#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>
#include "../../filters/path_filter.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../checkpoint/checkpoint.hpp"

namespace smartmig::core {

// Resuming is not a phase of its own: Initializing either loads a
// checkpoint or starts from scratch.
enum class Phase {
    Initializing,
    Scanning,
    Copying,
    Finalizing,
    Completed,
    CompletedWithFailures,
};

[[nodiscard]] auto to_string(Phase phase) -> std::string_view;

enum class RunStatus {
    Completed,              // nothing failed, checkpoint removed
    CompletedWithFailures,  // see state().failed_files; checkpoint kept for --resume
};

struct PendingFile {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string relative;   // key in MigrationState
};

/// Copies a project tree into `destination/<source name>`, one file at a
/// time, keeping a checkpoint so an interrupted run can be resumed.
///
/// Fatal outcomes (validation, unreadable checkpoint, checkpoint that cannot
/// be written, interruption) come back as errors. Failures of single files
/// do not stop the run; they end up in state().failed_files.
class TransferEngine {
public:
    TransferEngine(const infra::Config& config,
                   infra::ProgressMonitor& monitor,
                   std::shared_ptr<spdlog::logger> logger,
                   infra::InterruptCheck interrupted = infra::is_interrupted);

    [[nodiscard]] auto migrate(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               bool resume,
                               bool verify)
        -> infra::Result<RunStatus>;

    [[nodiscard]] auto state() const -> const MigrationState& { return state_; }
    [[nodiscard]] auto phase() const -> Phase { return phase_; }
    [[nodiscard]] auto filter() const -> const filters::PathFilter& { return filter_; }
    [[nodiscard]] auto checkpoint() const -> const Checkpoint& { return checkpoint_; }
    [[nodiscard]] auto files_copied_this_run() const -> std::uint64_t { return copied_this_run_; }

    // Same predicate for the size scan and for the pending-file walk.
    [[nodiscard]] bool is_excluded(const std::filesystem::path& relative) const;

private:
    [[nodiscard]] auto validate(const std::filesystem::path& source,
                                const std::filesystem::path& actual_destination) const
        -> infra::VoidResult;
    [[nodiscard]] auto load_resumable_state(const std::filesystem::path& source,
                                            const std::filesystem::path& destination)
        -> infra::Result<std::optional<MigrationState>>;
    void start_fresh(const std::filesystem::path& source,
                     const std::filesystem::path& destination);
    [[nodiscard]] auto collect_pending(const std::filesystem::path& source,
                                       const std::filesystem::path& actual_destination) const
        -> std::vector<PendingFile>;
    [[nodiscard]] auto copy_pending(const std::vector<PendingFile>& pending, bool verify)
        -> infra::VoidResult;
    [[nodiscard]] auto transfer_file(const PendingFile& file, bool verify)
        -> infra::Result<std::uintmax_t>;
    [[nodiscard]] auto save_on_interrupt() -> infra::Error;
    [[nodiscard]] auto finalize() -> infra::Result<RunStatus>;
    void enter(Phase phase);

    const infra::Config& config_;
    infra::ProgressMonitor& monitor_;
    std::shared_ptr<spdlog::logger> logger_;
    infra::InterruptCheck interrupted_;
    filters::PathFilter filter_;
    Checkpoint checkpoint_;

    MigrationState state_{};
    Phase phase_ = Phase::Initializing;
    std::filesystem::path source_root_;
    std::filesystem::path checkpoint_abs_;
    std::filesystem::path checkpoint_tmp_abs_;
    std::uint64_t copied_this_run_ = 0;
};

} // namespace smartmig::core
