#include "checksum.hpp"

#include <fstream>
#include <vector>
#include <fmt/core.h>
#include <xxhash.h>

namespace smartmig::infra {

namespace {

// Feeds the file to `update` in BUFFER_SIZE chunks; false on read error.
template<typename Update>
bool stream_file(const std::filesystem::path& path, Update&& update) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::vector<char> buffer(Checksum::BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        update(buffer.data(), static_cast<std::size_t>(file.gcount()));
        if (file.eof()) break;
    }
    return !file.bad();
}

auto digest_xxh32(const std::filesystem::path& path) -> std::string {
    XXH32_state_t* state = XXH32_createState();
    if (!state) return {};
    XXH32_reset(state, 0);
    const bool ok = stream_file(path, [state](const char* data, std::size_t len) {
        XXH32_update(state, data, len);
    });
    const XXH32_hash_t hash = XXH32_digest(state);
    XXH32_freeState(state);
    return ok ? fmt::format("{:08x}", hash) : std::string{};
}

auto digest_xxh64(const std::filesystem::path& path) -> std::string {
    XXH64_state_t* state = XXH64_createState();
    if (!state) return {};
    XXH64_reset(state, 0); // seed = 0
    const bool ok = stream_file(path, [state](const char* data, std::size_t len) {
        XXH64_update(state, data, len);
    });
    const XXH64_hash_t hash = XXH64_digest(state);
    XXH64_freeState(state);
    return ok ? fmt::format("{:016x}", hash) : std::string{};
}

auto digest_xxh3(const std::filesystem::path& path) -> std::string {
    XXH3_state_t* state = XXH3_createState();
    if (!state) return {};
    XXH3_64bits_reset(state);
    const bool ok = stream_file(path, [state](const char* data, std::size_t len) {
        XXH3_64bits_update(state, data, len);
    });
    const XXH64_hash_t hash = XXH3_64bits_digest(state);
    XXH3_freeState(state);
    return ok ? fmt::format("{:016x}", hash) : std::string{};
}

} // namespace

auto parse_hash_algorithm(std::string_view name) -> std::optional<HashAlgorithm> {
    if (name == "xxh32") return HashAlgorithm::XXH32;
    if (name == "xxh64") return HashAlgorithm::XXH64;
    if (name == "xxh3")  return HashAlgorithm::XXH3;
    return std::nullopt;
}

auto to_string(HashAlgorithm algorithm) -> std::string_view {
    switch (algorithm) {
        case HashAlgorithm::XXH32: return "xxh32";
        case HashAlgorithm::XXH3:  return "xxh3";
        case HashAlgorithm::XXH64: break;
    }
    return "xxh64";
}

auto Checksum::digest(const std::filesystem::path& path, HashAlgorithm algorithm) -> std::string {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return {};
    }

    switch (algorithm) {
        case HashAlgorithm::XXH32: return digest_xxh32(path);
        case HashAlgorithm::XXH3:  return digest_xxh3(path);
        case HashAlgorithm::XXH64: break;
    }
    return digest_xxh64(path);
}

auto Checksum::verify_copy(const std::filesystem::path& src,
                           const std::filesystem::path& dst,
                           HashAlgorithm algorithm) -> bool
{
    std::error_code ec;
    if (!std::filesystem::exists(dst, ec)) {
        return false;
    }

    const auto src_hash = digest(src, algorithm);
    const auto dst_hash = digest(dst, algorithm);
    if (src_hash.empty() || dst_hash.empty()) {
        return false;
    }
    return src_hash == dst_hash;
}

} // namespace smartmig::infra
