#pragma once

#include <string>
#include <string_view>

#include "../types.h"

namespace mc {
namespace file {

// Read entire file to string
Result<std::string> readText(const Path& path);

// Write string to file, truncating any previous content
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// Write to "<path>.tmp" then rename over path, so readers never see a
// half-written file. The temp file is removed on failure.
[[nodiscard]] bool writeTextAtomic(const Path& path, std::string_view content);

bool exists(const Path& path);

// Succeeds when the directory already exists; an empty path is a no-op
[[nodiscard]] bool createDirectories(const Path& path);

} // namespace file
} // namespace mc
