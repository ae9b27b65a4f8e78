#include "fs.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>
#include <fmt/core.h>

namespace smartmig::adapters::fs {

namespace {

auto last_errno() -> std::error_code {
    if (errno == 0) {
        return std::make_error_code(std::errc::io_error);
    }
    return std::error_code(errno, std::generic_category());
}

} // namespace

auto prepare_destination(const std::filesystem::path& dst) -> infra::VoidResult {
    std::error_code ec;
    const auto parent = dst.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::WriteFailed,
                fmt::format("Cannot create directory {}", parent.string())));
        }
    }

    // A read-only leftover from an earlier attempt would refuse the rewrite.
    if (std::filesystem::is_symlink(dst, ec) || std::filesystem::exists(dst, ec)) {
        std::filesystem::remove(dst, ec);
        if (ec) {
            return std::unexpected(infra::error_from_errc(ec, infra::ErrorCode::WriteFailed,
                fmt::format("Cannot remove existing file {}", dst.string())));
        }
    }
    return {};
}

auto copy_file_chunked(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t chunk_size,
    const infra::InterruptCheck& interrupted
) -> infra::Result<std::uintmax_t>
{
    if (chunk_size == 0) chunk_size = infra::default_chunk_size;

    errno = 0;
    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::error_from_errc(last_errno(), infra::ErrorCode::ReadFailed,
            fmt::format("Cannot open {}", src.string())));
    }

    errno = 0;
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(infra::error_from_errc(last_errno(), infra::ErrorCode::WriteFailed,
            fmt::format("Cannot create {}", dst.string())));
    }

    std::vector<char> buffer(chunk_size);
    std::uintmax_t written = 0;
    for (;;) {
        if (interrupted && interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("Interrupted while copying {}", src.string())));
        }

        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = ifs.gcount();
        if (ifs.bad()) {
            return std::unexpected(infra::error_from_errc(last_errno(), infra::ErrorCode::ReadFailed,
                fmt::format("Read error in {}", src.string())));
        }
        if (got > 0 && !ofs.write(buffer.data(), got)) {
            return std::unexpected(infra::error_from_errc(last_errno(), infra::ErrorCode::WriteFailed,
                fmt::format("Write error in {}", dst.string())));
        }
        written += static_cast<std::uintmax_t>(got);
        if (ifs.eof() || got == 0) {
            break;
        }
    }

    ofs.close();
    if (!ofs) {
        return std::unexpected(infra::error_from_errc(last_errno(), infra::ErrorCode::WriteFailed,
            fmt::format("Cannot finish writing {}", dst.string())));
    }
    return written;
}

} // namespace smartmig::adapters::fs
