#include "error.hpp"
#include <cstdlib>
#include <system_error>
#include <fmt/core.h>

namespace smartmig::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::SourceNotFound:    return "source not found";
        case ErrorCode::NotADirectory:     return "not a directory";
        case ErrorCode::InvalidDestination: return "invalid destination";
        case ErrorCode::StateCorrupted:    return "state corrupted";
        case ErrorCode::PersistenceFailed: return "persistence failed";
        case ErrorCode::ReadFailed:        return "read failed";
        case ErrorCode::WriteFailed:       return "write failed";
        case ErrorCode::PermissionDenied:  return "permission denied";
        case ErrorCode::ChecksumMismatch:  return "checksum mismatch";
        case ErrorCode::Interrupted:       return "interrupted";
    }
    return "unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceNotFound:
        case ErrorCode::NotADirectory:
        case ErrorCode::InvalidDestination:
        case ErrorCode::StateCorrupted:
        case ErrorCode::PersistenceFailed:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Interrupted:      return 130; // SIGINT
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error error_from_errc(const std::error_code& ec, ErrorCode fallback,
                      std::string_view message, const std::source_location& loc) {
    auto code = fallback;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PermissionDenied;
    }
    return Error{code, fmt::format("{}: {}", message, ec.message()), loc};
}

Error log_and_return(spdlog::logger& logger, Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    logger.log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace smartmig::infra
