#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace smartmig::core {

// Receives the path relative to the scanned root.
using ExcludePredicate = std::function<bool(const std::filesystem::path&)>;

struct ScannedFile {
    std::filesystem::path absolute;
    std::filesystem::path relative;
    std::uintmax_t size = 0;
};

struct ScanReport {
    std::uintmax_t total_bytes = 0;
    std::uint64_t file_count = 0;
    std::vector<std::string> warnings;
};

/// Visits every regular file under `root` that `exclude` does not reject.
/// Entries that cannot be accessed are skipped and reported in `warnings`;
/// the walk itself never aborts.
void walk_files(const std::filesystem::path& root,
                const ExcludePredicate& exclude,
                const std::function<void(ScannedFile&&)>& visit,
                std::vector<std::string>& warnings);

/// Sums the on-disk size of the files walk_files would visit.
[[nodiscard]] auto scan_tree(const std::filesystem::path& root,
                             const ExcludePredicate& exclude,
                             spdlog::logger& logger) -> ScanReport;

[[nodiscard]] auto total_size(const std::filesystem::path& root,
                              const ExcludePredicate& exclude,
                              spdlog::logger& logger) -> std::uintmax_t;

} // namespace smartmig::core
