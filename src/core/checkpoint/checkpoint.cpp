#include "checkpoint.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#ifndef _WIN32
    #include <fcntl.h>
    #include <unistd.h>
#endif

namespace smartmig::core {

namespace {

auto corrupted(std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::StateCorrupted, what);
}

#ifndef _WIN32
// rename() alone does not order the data blocks before the directory entry.
bool sync_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}
#else
bool sync_file(const std::filesystem::path&) { return true; }
#endif

// Length of the well-formed UTF-8 sequence starting at text[pos], or 0.
// Overlong forms, surrogates and code points past U+10FFFF are ill-formed.
std::size_t utf8_sequence(std::string_view text, std::size_t pos, char32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 0;
    char32_t min = 0;
    if (lead >= 0xC2 && lead <= 0xDF)      { len = 2; cp = lead & 0x1F; min = 0x80; }
    else if (lead >= 0xE0 && lead <= 0xEF) { len = 3; cp = lead & 0x0F; min = 0x800; }
    else if (lead >= 0xF0 && lead <= 0xF4) { len = 4; cp = lead & 0x07; min = 0x10000; }
    else return 0;

    if (pos + len > text.size()) return 0;
    for (std::size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

void append_escaped(std::string& out, std::string_view bytes) {
    for (const char c : bytes) {
        out += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    }
}

// File names are arbitrary bytes, JSON strings are UTF-8 text. Anything the
// emitter would replace or write as a YAML-only escape is stored as %XX.
auto encode_text(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto c = static_cast<unsigned char>(text[pos]);
        if (c < 0x80) {
            if (c < 0x20 || c == 0x7F || c == '%') {
                append_escaped(out, text.substr(pos, 1));
            } else {
                out += static_cast<char>(c);
            }
            ++pos;
            continue;
        }

        char32_t cp = 0;
        const auto len = utf8_sequence(text, pos, cp);
        if (len == 0) {
            append_escaped(out, text.substr(pos, 1));
            ++pos;
        } else if (cp <= 0xA0 || cp == 0xFEFF) {
            append_escaped(out, text.substr(pos, len));
            pos += len;
        } else {
            out.append(text.substr(pos, len));
            pos += len;
        }
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

auto decode_text(std::string_view text) -> std::optional<std::string> {
    std::string out;
    out.reserve(text.size());
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (text[pos] != '%') {
            out += text[pos];
            continue;
        }
        if (pos + 2 >= text.size()) {
            return std::nullopt;
        }
        const int hi = hex_value(text[pos + 1]);
        const int lo = hex_value(text[pos + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>(hi * 16 + lo);
        pos += 2;
    }
    return out;
}

auto read_text(const YAML::Node& node, std::string_view field) -> infra::Result<std::string> {
    auto decoded = decode_text(node.as<std::string>());
    if (!decoded) {
        return std::unexpected(corrupted(fmt::format("bad %-escape in '{}'", field)));
    }
    return std::move(*decoded);
}

} // namespace

auto normalize_job_path(const std::filesystem::path& p) -> std::filesystem::path {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    auto out = (ec ? p : abs).lexically_normal();
    if (!out.has_filename() && out.has_relative_path()) {
        out = out.parent_path();
    }
    return out;
}

void MigrationState::record_copied(const std::string& relative_path, std::uint64_t size) {
    failed_files.erase(relative_path);
    if (copied_files.insert(relative_path).second) {
        copied_size += size;
    }
}

void MigrationState::record_failed(const std::string& relative_path, std::string reason) {
    copied_files.erase(relative_path);
    failed_files[relative_path] = std::move(reason);
}

bool MigrationState::matches(const std::filesystem::path& source,
                             const std::filesystem::path& destination) const {
    return normalize_job_path(source_path) == normalize_job_path(source)
        && normalize_job_path(destination_path) == normalize_job_path(destination);
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

auto parse_timestamp(std::string_view text) -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream in{std::string(text)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    char zone = '\0';
    if (!(in >> zone) || zone != 'Z') {
        return std::nullopt;
    }
#ifdef _WIN32
    const std::time_t t = _mkgmtime(&tm);
#else
    const std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

Checkpoint::Checkpoint(std::filesystem::path file)
    : file_(std::move(file))
{}

auto Checkpoint::serialize(const MigrationState& state) -> std::string {
    // JSON is a subset of flow-style YAML with double-quoted scalars.
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);

    std::vector<std::string> copied;
    copied.reserve(state.copied_files.size());
    for (const auto& f : state.copied_files) {
        copied.push_back(encode_text(f));
    }
    std::sort(copied.begin(), copied.end());

    out << YAML::BeginMap;
    out << YAML::Key << "source_path" << YAML::Value << encode_text(state.source_path.string());
    out << YAML::Key << "destination_path" << YAML::Value << encode_text(state.destination_path.string());
    out << YAML::Key << "total_size" << YAML::Value << state.total_size;
    out << YAML::Key << "copied_size" << YAML::Value << state.copied_size;
    out << YAML::Key << "copied_files" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : copied) {
        out << f;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "failed_files" << YAML::Value << YAML::BeginMap;
    for (const auto& [path, reason] : state.failed_files) {
        out << YAML::Key << encode_text(path) << YAML::Value << encode_text(reason);
    }
    out << YAML::EndMap;
    out << YAML::Key << "start_time" << YAML::Value << format_timestamp(state.start_time);
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

auto Checkpoint::deserialize(const std::string& text) -> infra::Result<MigrationState> {
    try {
        const YAML::Node node = YAML::Load(text);
        if (!node.IsMap()) {
            return std::unexpected(corrupted("checkpoint is not an object"));
        }

        for (const char* key : {"source_path", "destination_path", "total_size",
                                "copied_size", "copied_files", "failed_files", "start_time"}) {
            if (!node[key]) {
                return std::unexpected(corrupted(fmt::format("missing field '{}'", key)));
            }
        }

        MigrationState state;
        auto source = read_text(node["source_path"], "source_path");
        if (!source) return std::unexpected(std::move(source.error()));
        auto destination = read_text(node["destination_path"], "destination_path");
        if (!destination) return std::unexpected(std::move(destination.error()));
        state.source_path = std::move(*source);
        state.destination_path = std::move(*destination);
        state.total_size = node["total_size"].as<std::uint64_t>();
        state.copied_size = node["copied_size"].as<std::uint64_t>();

        const auto copied = node["copied_files"];
        if (!copied.IsSequence()) {
            return std::unexpected(corrupted("'copied_files' is not a list"));
        }
        for (const auto& item : copied) {
            auto path = read_text(item, "copied_files");
            if (!path) return std::unexpected(std::move(path.error()));
            state.copied_files.insert(std::move(*path));
        }

        const auto failed = node["failed_files"];
        if (!failed.IsMap()) {
            return std::unexpected(corrupted("'failed_files' is not an object"));
        }
        for (const auto& item : failed) {
            auto path = read_text(item.first, "failed_files");
            if (!path) return std::unexpected(std::move(path.error()));
            auto reason = read_text(item.second, "failed_files");
            if (!reason) return std::unexpected(std::move(reason.error()));
            if (state.copied_files.contains(*path)) {
                return std::unexpected(corrupted(
                    fmt::format("'{}' is recorded as both copied and failed", encode_text(*path))));
            }
            state.failed_files.emplace(std::move(*path), std::move(*reason));
        }

        const auto start = parse_timestamp(node["start_time"].as<std::string>());
        if (!start) {
            return std::unexpected(corrupted("'start_time' is not a UTC timestamp"));
        }
        state.start_time = *start;

        return state;
    } catch (const YAML::Exception& e) {
        return std::unexpected(corrupted(fmt::format("malformed checkpoint: {}", e.what())));
    }
}

auto Checkpoint::save(const MigrationState& state) const -> infra::VoidResult {
    std::error_code ec;
    const auto parent = file_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PersistenceFailed,
                fmt::format("Cannot create checkpoint directory {}: {}", parent.string(), ec.message())));
        }
    }

    auto tmp = file_;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PersistenceFailed,
                fmt::format("Cannot open {} for writing", tmp.string())));
        }
        ofs << serialize(state);
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            return std::unexpected(infra::make_error(infra::ErrorCode::PersistenceFailed,
                fmt::format("Short write to {}", tmp.string())));
        }
    }

    if (!sync_file(tmp)) {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(infra::make_error(infra::ErrorCode::PersistenceFailed,
            fmt::format("Cannot sync {}", tmp.string())));
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(tmp, ec);
        return std::unexpected(infra::make_error(infra::ErrorCode::PersistenceFailed,
            fmt::format("Cannot replace {}: {}", file_.string(), message)));
    }
    return {};
}

auto Checkpoint::load() const -> infra::Result<std::optional<MigrationState>> {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
                fmt::format("Cannot access {}: {}", file_.string(), ec.message())));
        }
        return std::optional<MigrationState>{};
    }

    std::ifstream ifs(file_, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
            fmt::format("Cannot open {}", file_.string())));
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
            fmt::format("Cannot read {}", file_.string())));
    }

    auto state = deserialize(buffer.str());
    if (!state) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupted,
            fmt::format("{}: {}", file_.string(), state.error().message)));
    }
    return std::optional<MigrationState>{std::move(*state)};
}

void Checkpoint::cleanup() const noexcept {
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    auto tmp = file_;
    tmp += ".tmp";
    std::filesystem::remove(tmp, ec);
}

bool Checkpoint::exists() const {
    std::error_code ec;
    return std::filesystem::exists(file_, ec);
}

} // namespace smartmig::core
