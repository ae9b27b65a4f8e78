#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace smartmig::infra {

struct LogOptions {
    std::string name = "smartmig";
    std::string file;        // empty: console only
    bool verbose = false;
    bool quiet = false;
};

/// Console (stderr, coloured) plus an optional append-only file sink.
/// The file sink always records at least info so per-file failures
/// survive a quiet console.
[[nodiscard]] auto make_logger(const LogOptions& options)
    -> std::shared_ptr<spdlog::logger>;

/// Logger that drops everything; used where no reporting is wanted.
[[nodiscard]] auto make_null_logger(const std::string& name = "smartmig-null")
    -> std::shared_ptr<spdlog::logger>;

} // namespace smartmig::infra
