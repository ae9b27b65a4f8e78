#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace smartmig::infra {

/// Byte-based progress bar. Counters are atomic so the renderer thread can
/// read them while the copy loop updates them.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::uint64_t resumed_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t files, std::uint64_t bytes);
    // Work already done by an earlier, interrupted run.
    void set_initial(std::uint64_t files, std::uint64_t bytes);
    void update(std::uint64_t files = 0, std::uint64_t bytes = 0);

    // Stops the renderer and prints the final state of the bar.
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> resumed_bytes_{0};
    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> total_bytes_{0};

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace smartmig::infra
