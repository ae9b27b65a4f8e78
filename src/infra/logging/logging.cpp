#include "logging.hpp"

#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace smartmig::infra {

namespace {
constexpr auto log_pattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
}

auto make_logger(const LogOptions& options) -> std::shared_ptr<spdlog::logger> {
    const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(options.quiet ? spdlog::level::warn : level);

    std::vector<spdlog::sink_ptr> sinks{console};
    std::string file_error;

    if (!options.file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file, false);
            file->set_level(level);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(log_pattern);
    logger->flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        logger->warn("Cannot open log file {}: {}", options.file, file_error);
    }
    return logger;
}

auto make_null_logger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace smartmig::infra
