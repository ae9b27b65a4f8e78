#include "size_scanner.hpp"

#include <fmt/core.h>

#ifndef _WIN32
    #include <unistd.h>
#endif

namespace smartmig::core {

namespace {

bool is_traversable(const std::filesystem::path& dir) {
#ifndef _WIN32
    return ::access(dir.c_str(), R_OK | X_OK) == 0;
#else
    std::error_code ec;
    std::filesystem::directory_iterator probe(dir, ec);
    return !ec;
#endif
}

} // namespace

void walk_files(const std::filesystem::path& root,
                const ExcludePredicate& exclude,
                const std::function<void(ScannedFile&&)>& visit,
                std::vector<std::string>& warnings)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        warnings.push_back(fmt::format("Cannot access directory {}: {}", root.string(), ec.message()));
        return;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        const auto& entry = *it;

        std::error_code dir_ec;
        if (entry.is_directory(dir_ec) && !entry.is_symlink(dir_ec)) {
            if (!is_traversable(entry.path())) {
                warnings.push_back(fmt::format("Skipping unreadable directory {}", entry.path().string()));
                it.disable_recursion_pending();
            }
            continue;
        }

        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            if (type_ec && type_ec != std::errc::no_such_file_or_directory) {
                warnings.push_back(fmt::format("Cannot stat {}: {}", entry.path().string(), type_ec.message()));
            }
            continue;
        }

        auto relative = entry.path().lexically_relative(root);
        if (exclude && exclude(relative)) {
            continue;
        }

        std::error_code size_ec;
        const auto size = entry.file_size(size_ec);
        if (size_ec) {
            warnings.push_back(fmt::format("Cannot access {}: {}", entry.path().string(), size_ec.message()));
            continue;
        }

        visit(ScannedFile{entry.path(), std::move(relative), size});
    }

    // A failed increment leaves the iterator at end.
    if (ec) {
        warnings.push_back(fmt::format("Walk of {} stopped early: {}", root.string(), ec.message()));
    }
}

auto scan_tree(const std::filesystem::path& root,
               const ExcludePredicate& exclude,
               spdlog::logger& logger) -> ScanReport
{
    ScanReport report;
    walk_files(root, exclude, [&report](ScannedFile&& file) {
        report.total_bytes += file.size;
        ++report.file_count;
    }, report.warnings);

    for (const auto& warning : report.warnings) {
        logger.warn(warning);
    }
    logger.debug("Scanned {}: {} files, {} bytes", root.string(), report.file_count, report.total_bytes);
    return report;
}

auto total_size(const std::filesystem::path& root,
                const ExcludePredicate& exclude,
                spdlog::logger& logger) -> std::uintmax_t
{
    return scan_tree(root, exclude, logger).total_bytes;
}

} // namespace smartmig::core
