#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace smartmig::infra {

// Non-cryptographic digests: accidental corruption detection only.
enum class HashAlgorithm {
    XXH32,
    XXH64,
    XXH3,   // 64-bit XXH3
};

[[nodiscard]] auto parse_hash_algorithm(std::string_view name) -> std::optional<HashAlgorithm>;
[[nodiscard]] auto to_string(HashAlgorithm algorithm) -> std::string_view;

class Checksum {
public:
    // Lower-case hex digest of the file, or an empty string if the file
    // could not be read. The empty string never equals a real digest.
    static auto digest(const std::filesystem::path& path,
                       HashAlgorithm algorithm = HashAlgorithm::XXH64) -> std::string;

    // false when dst is missing, when either digest is unavailable,
    // or when the digests differ.
    static auto verify_copy(const std::filesystem::path& src,
                            const std::filesystem::path& dst,
                            HashAlgorithm algorithm = HashAlgorithm::XXH64) -> bool;

    static constexpr std::size_t BUFFER_SIZE = 4 * 1024; // 4KB chunks
};

} // namespace smartmig::infra
