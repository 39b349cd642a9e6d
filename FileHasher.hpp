#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace FileHasher {
// Returned instead of a digest for files larger than the size cap. Two such
// files compare equal.
inline constexpr std::string_view kLargeFileMarker = "LARGE_FILE";

inline constexpr std::size_t kChunkSize = 4096;

// Hex MD5 of the file contents, kLargeFileMarker when the file exceeds
// `maxSizeBytes` (0 disables the cap), or nullopt on any I/O failure.
std::optional<std::string> hash(const fs::path& path,
                                std::uintmax_t maxSizeBytes = kDefaultMaxHashSize);
}  // namespace FileHasher
