#include "metadata.hpp"
#include <fmt/core.h>

namespace smartmig::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    // Permissions first: a read-only mode must not block the timestamp update.
#ifndef _WIN32
    auto status = std::filesystem::status(src, ec);
    if (ec) {
        return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::ReadFailed,
            fmt::format("Cannot stat {}", src.string())));
    }
    std::filesystem::permissions(dst, status.permissions(), ec);
    if (ec) {
        return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::WriteFailed,
            fmt::format("Cannot set permissions on {}", dst.string())));
    }
#endif

    auto time = std::filesystem::last_write_time(src, ec);
    if (ec) {
        return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::ReadFailed,
            fmt::format("Cannot read modification time of {}", src.string())));
    }
    std::filesystem::last_write_time(dst, time, ec);
    if (ec) {
        return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::WriteFailed,
            fmt::format("Cannot set modification time on {}", dst.string())));
    }
    return {};
}

} // namespace smartmig::extensions
