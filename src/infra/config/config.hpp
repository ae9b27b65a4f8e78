#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../hash/checksum.hpp"

namespace smartmig::args_parser {
    struct CLIArgs;
}

namespace smartmig::infra {

inline constexpr const char* default_checkpoint_file = ".migration_state.json";
inline constexpr const char* default_log_file = "migration.log";
inline constexpr std::uint32_t default_checkpoint_interval = 100;
inline constexpr std::size_t default_chunk_size = 64 * 1024;

struct Config {
    // Behaviour
    bool verify = false;
    bool resume = false;
    bool progress = true;
    bool quiet = false;
    bool verbose = false;

    // Files
    std::optional<std::filesystem::path> checkpoint_file;
    std::optional<std::string> log_file;        // "" disables the file sink

    // Transfer
    std::optional<std::uint32_t> checkpoint_interval;   // successful copies between saves
    std::optional<std::size_t> chunk_size;              // bytes
    std::optional<HashAlgorithm> hash_algorithm;

    // Layered on top of the PathFilter defaults
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;

    // Values set in `other` win; pattern lists are appended.
    void merge_with(const Config& other);

    [[nodiscard]] auto checkpoint_path() const -> std::filesystem::path {
        return checkpoint_file.value_or(default_checkpoint_file);
    }
    [[nodiscard]] auto log_path() const -> std::string {
        return log_file.value_or(default_log_file);
    }
};

/// Loads configuration from a YAML file.
/// Search order:
///   1. ./.smartmig.yaml
///   2. $XDG_CONFIG_HOME/smartmig/config.yaml, else ~/.config/smartmig/config.yaml
/// Returns a default Config if no file is found.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one explicit YAML file.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string>;

/// Config holding only what was given on the command line.
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace smartmig::infra
