#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace smartmig::infra {

namespace {

auto human_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes > 1024.0 * 1024 * 1024) { bytes /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (bytes > 1024.0 * 1024) { bytes /= 1024.0 * 1024; unit = "MB"; }
    else if (bytes > 1024.0) { bytes /= 1024.0; unit = "KB"; }
    return fmt::format("{:.1f} {}", bytes, unit);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::set_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_ = files;
    total_bytes_ = bytes;
}

void ProgressMonitor::set_initial(std::uint64_t files, std::uint64_t bytes) {
    processed_files_ = files;
    processed_bytes_ = bytes;
    resumed_bytes_ = bytes;
}

void ProgressMonitor::update(std::uint64_t files, std::uint64_t bytes) {
    processed_files_ += files;
    processed_bytes_ += bytes;
}

void ProgressMonitor::finish() {
    if (finished_.exchange(true)) return;
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::fputs("\n", stdout);
        std::fflush(stdout);
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .total_bytes = total_bytes_.load(),
        .processed_bytes = processed_bytes_.load(),
        .resumed_bytes = resumed_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // joins
    }
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    const auto stats = get_stats();
    if (stats.total_bytes == 0 && stats.total_files == 0) return;

    const double fraction = stats.total_bytes > 0
        ? std::min(1.0, static_cast<double>(stats.processed_bytes) / static_cast<double>(stats.total_bytes))
        : 1.0;
    constexpr int bar_width = 20;
    const int filled = static_cast<int>(fraction * bar_width);

    // Speed only counts bytes moved by this run
    const auto elapsed_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - stats.start_time).count();
    const double moved = static_cast<double>(stats.processed_bytes - std::min(stats.processed_bytes, stats.resumed_bytes));
    const double bytes_per_sec = elapsed_sec > 0 ? moved / elapsed_sec : 0.0;

    std::string eta_str = "--:--";
    if (bytes_per_sec > 0 && stats.total_bytes > stats.processed_bytes) {
        const double eta_sec = static_cast<double>(stats.total_bytes - stats.processed_bytes) / bytes_per_sec;
        if (std::isfinite(eta_sec)) {
            int seconds = static_cast<int>(eta_sec);
            const int hours = seconds / 3600;
            const int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            eta_str = hours > 0 ? fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds)
                                : fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // \r\033[K: rewrite the current line
    fmt::print("\r\033[K[{}] {:5.1f}% | {} / {} | {}/s | ETA: {} | {}/{} files",
               bar, fraction * 100.0,
               human_bytes(static_cast<double>(stats.processed_bytes)),
               human_bytes(static_cast<double>(stats.total_bytes)),
               human_bytes(bytes_per_sec), eta_str,
               stats.processed_files, stats.total_files);
    std::fflush(stdout);
}

} // namespace smartmig::infra
