#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace smartmig::infra {

void Config::merge_with(const Config& other) {
    if (other.verify) verify = true;
    if (other.resume) resume = true;
    if (!other.progress) progress = false; // CLI may only switch it off
    if (other.quiet) quiet = true;
    if (other.verbose) verbose = true;

    if (other.checkpoint_file) checkpoint_file = other.checkpoint_file;
    if (other.log_file) log_file = other.log_file;
    if (other.checkpoint_interval) checkpoint_interval = other.checkpoint_interval;
    if (other.chunk_size) chunk_size = other.chunk_size;
    if (other.hash_algorithm) hash_algorithm = other.hash_algorithm;

    exclude_patterns.insert(exclude_patterns.end(),
                            other.exclude_patterns.begin(), other.exclude_patterns.end());
    include_patterns.insert(include_patterns.end(),
                            other.include_patterns.begin(), other.include_patterns.end());
}

static auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    paths.push_back(".smartmig.yaml");

    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "smartmig" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "smartmig" / "config.yaml");
        }
    }

    return paths;
}

auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    try {
        YAML::Node config = YAML::LoadFile(path.string());
        Config cfg{};

        if (config.IsNull()) {
            return cfg; // empty file
        }
        if (!config.IsMap()) {
            return std::unexpected(fmt::format("Failed to parse {}: top level must be a mapping", path.string()));
        }

        if (config["verify"]) cfg.verify = config["verify"].as<bool>();
        if (config["resume"]) cfg.resume = config["resume"].as<bool>();
        if (config["progress"]) cfg.progress = config["progress"].as<bool>();
        if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
        if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();

        if (config["checkpoint_file"]) cfg.checkpoint_file = config["checkpoint_file"].as<std::string>();
        if (config["log_file"]) cfg.log_file = config["log_file"].as<std::string>();
        if (config["checkpoint_interval"]) {
            const auto interval = config["checkpoint_interval"].as<std::uint32_t>();
            if (interval == 0) {
                return std::unexpected(fmt::format("Failed to parse {}: checkpoint_interval must be positive", path.string()));
            }
            cfg.checkpoint_interval = interval;
        }
        if (config["chunk_size"]) {
            const auto chunk = config["chunk_size"].as<std::size_t>();
            if (chunk == 0) {
                return std::unexpected(fmt::format("Failed to parse {}: chunk_size must be positive", path.string()));
            }
            cfg.chunk_size = chunk;
        }
        if (config["hash"]) {
            const auto name = config["hash"].as<std::string>();
            auto algorithm = parse_hash_algorithm(name);
            if (!algorithm) {
                return std::unexpected(fmt::format("Failed to parse {}: unknown hash '{}'", path.string(), name));
            }
            cfg.hash_algorithm = *algorithm;
        }

        if (config["exclude"]) {
            for (const auto& pat : config["exclude"]) {
                cfg.exclude_patterns.push_back(pat.as<std::string>());
            }
        }
        if (config["include"]) {
            for (const auto& pat : config["include"]) {
                cfg.include_patterns.push_back(pat.as<std::string>());
            }
        }

        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        return load_config(path);
    }

    // No file is not an error
    return Config{};
}

auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.verify = args.verify;
    cfg.resume = args.resume;
    cfg.progress = args.progress;
    cfg.quiet = args.quiet;
    cfg.verbose = args.verbose;
    if (args.state_file) cfg.checkpoint_file = *args.state_file;
    if (args.log_file) cfg.log_file = *args.log_file;
    if (args.hash) cfg.hash_algorithm = parse_hash_algorithm(*args.hash);
    cfg.exclude_patterns = args.exclude;
    cfg.include_patterns = args.include;
    return cfg;
}

} // namespace smartmig::infra
