#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include "../infra/config/config.hpp"
#include "../infra/error_handler/error.hpp"
#include "../infra/interrupt.hpp"

namespace smartmig::adapters::fs {

// Creates the parent directories of `dst` and removes a leftover `dst`.
[[nodiscard]] auto prepare_destination(const std::filesystem::path& dst)
    -> infra::VoidResult;

// Streams `src` into `dst` chunk by chunk, polling `interrupted` between
// chunks, and returns the number of bytes written. A partially written
// `dst` is left in place on failure.
[[nodiscard]] auto copy_file_chunked(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t chunk_size = infra::default_chunk_size,
    const infra::InterruptCheck& interrupted = {}
) -> infra::Result<std::uintmax_t>;

} // namespace smartmig::adapters::fs
