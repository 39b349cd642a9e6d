#pragma once

#include <expected>

#include "types.hpp"

namespace PathSanitizer {
// Returns the lexically normalized path, or InvalidPath when the input is
// empty, starts with "..", or still climbs above its root after
// normalization.
std::expected<fs::path, ErrorKind> sanitize(const fs::path& path);
}  // namespace PathSanitizer
