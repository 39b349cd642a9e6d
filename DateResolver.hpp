#pragma once

#include <expected>
#include <optional>
#include <string_view>

#include "types.hpp"

// Capability boundary for metadata-based dates. Implementations must not
// throw; "no date" covers missing, unsupported and malformed metadata.
class DateExtractor {
 public:
  virtual ~DateExtractor() = default;
  virtual std::optional<CaptureDate> extract(const fs::path& path) const = 0;
};

class ExifDateExtractor : public DateExtractor {
 public:
  std::optional<CaptureDate> extract(const fs::path& path) const override;
};

// Parses the leading "YYYY:MM:DD" (or "YYYY-MM-DD") of an EXIF timestamp.
std::optional<CaptureDate> parse_exif_date(std::string_view value);

class DateResolver {
 public:
  // `extractor` may be null; the resolver then only uses filesystem times.
  explicit DateResolver(const DateExtractor* extractor = nullptr);

  // Fails with IOFailure only when the file cannot be stat'ed at all.
  std::expected<CaptureDate, ErrorKind> resolve(
      const fs::path& path, bool preferExternalMetadata) const;

  static std::expected<CaptureDate, ErrorKind> filesystem_date(
      const fs::path& path);

 private:
  const DateExtractor* m_extractor;
};
