#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include "../../infra/error_handler/error.hpp"

namespace smartmig::core {

/// Progress of one migration job. Paths in copied_files / failed_files are
/// relative to source_path, in generic ('/') form.
struct MigrationState {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uint64_t total_size = 0;
    std::uint64_t copied_size = 0;
    std::unordered_set<std::string> copied_files;
    std::map<std::string, std::string> failed_files;
    std::chrono::system_clock::time_point start_time{};

    // Keeps copied_files and failed_files disjoint.
    void record_copied(const std::string& relative_path, std::uint64_t size);
    void record_failed(const std::string& relative_path, std::string reason);

    [[nodiscard]] bool is_copied(const std::string& relative_path) const {
        return copied_files.contains(relative_path);
    }
    [[nodiscard]] bool matches(const std::filesystem::path& source,
                               const std::filesystem::path& destination) const;

    bool operator==(const MigrationState&) const = default;
};

// Absolute, lexically normal, without a trailing separator.
[[nodiscard]] auto normalize_job_path(const std::filesystem::path& p) -> std::filesystem::path;

// UTC, second precision: 2024-05-01T13:45:07Z
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;
[[nodiscard]] auto parse_timestamp(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

/// Durable copy of a MigrationState, stored as a JSON document at a fixed path.
class Checkpoint {
public:
    explicit Checkpoint(std::filesystem::path file);

    // Writes a temporary file next to the target and renames it over the
    // target, so a torn write never replaces a good checkpoint.
    [[nodiscard]] auto save(const MigrationState& state) const -> infra::VoidResult;

    // nullopt when no checkpoint exists; StateCorrupted when one exists but
    // cannot be read back.
    [[nodiscard]] auto load() const -> infra::Result<std::optional<MigrationState>>;

    // Best effort.
    void cleanup() const noexcept;

    [[nodiscard]] bool exists() const;
    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

    [[nodiscard]] static auto serialize(const MigrationState& state) -> std::string;
    [[nodiscard]] static auto deserialize(const std::string& text) -> infra::Result<MigrationState>;

private:
    std::filesystem::path file_;
};

} // namespace smartmig::core
