#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace smartmig::infra {

enum class ErrorCode {
    // Validation (nothing was started)
    SourceNotFound,
    NotADirectory,
    InvalidDestination,

    // Checkpoint
    StateCorrupted,
    PersistenceFailed,

    // Per-file (recorded in failed_files, the run continues)
    ReadFailed,
    WriteFailed,
    PermissionDenied,
    ChecksumMismatch,

    Interrupted,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Failures that only affect the file being transferred.
    [[nodiscard]] auto is_per_file() const -> bool {
        return code == ErrorCode::ReadFailed ||
               code == ErrorCode::WriteFailed ||
               code == ErrorCode::PermissionDenied ||
               code == ErrorCode::ChecksumMismatch;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Maps an errno-style error_code onto the per-file codes.
[[nodiscard]] auto error_from_errc(
    const std::error_code& ec,
    ErrorCode fallback,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Logs the error (err for fatal, warn otherwise) and hands it back.
[[nodiscard]] auto log_and_return(spdlog::logger& logger, Error&& err) -> Error;

} // namespace smartmig::infra
