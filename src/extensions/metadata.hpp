#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace smartmig::extensions {

// Mirrors modification time and permission bits (not ownership, not xattrs).
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace smartmig::extensions
