#include "PathSanitizer.hpp"

#include <string>

std::expected<fs::path, ErrorKind> PathSanitizer::sanitize(
    const fs::path& path) {
  if (path.empty()) {
    return std::unexpected(ErrorKind::InvalidPath);
  }

  const std::string native = path.string();
  if (native.find('\0') != std::string::npos) {
    return std::unexpected(ErrorKind::InvalidPath);
  }

  if (auto first = path.begin(); first != path.end() && *first == "..") {
    return std::unexpected(ErrorKind::InvalidPath);
  }

  fs::path normalized = path.lexically_normal();
  for (const auto& segment : normalized) {
    if (segment == "..") {
      return std::unexpected(ErrorKind::InvalidPath);
    }
  }
  return normalized;
}
