#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

inline constexpr std::uintmax_t kDefaultMaxHashSize = 100ull * 1024 * 1024;
// Largest MiB cap whose byte count still fits in std::uintmax_t.
inline constexpr std::uintmax_t kMaxHashSizeMb = UINTMAX_MAX >> 20;

struct CaptureDate {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;

  bool operator==(const CaptureDate&) const = default;

  std::string to_string() const {
    return std::format("{:04}-{:02}-{:02}", year, month, day);
  }
};

struct LayoutPolicy {
  bool daily_folders = false;
  bool year_as_separate_level = true;
};

struct ExclusionMatcher {
  std::string pattern;
  bool is_regex = false;
};

struct ExtractionCriteria {
  bool recursive = false;
  // Lower-case, dot-prefixed. Empty means every extension passes.
  std::vector<std::string> extensions;
  std::optional<ExclusionMatcher> exclusion;
};

enum class ErrorKind {
  InvalidPath,
  InvalidPattern,
  IOFailure,
  PermissionDenied,
  NameConflict,
  HashFailure,
  SourceMissing
};

inline std::string_view to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidPath:
      return "InvalidPath";
    case ErrorKind::InvalidPattern:
      return "InvalidPattern";
    case ErrorKind::IOFailure:
      return "IOFailure";
    case ErrorKind::PermissionDenied:
      return "PermissionDenied";
    case ErrorKind::NameConflict:
      return "NameConflict";
    case ErrorKind::HashFailure:
      return "HashFailure";
    case ErrorKind::SourceMissing:
      return "SourceMissing";
  }
  return "Unknown";
}

enum class OutcomeKind { Moved, Copied, SkippedDuplicate, DeletedDuplicate, Failed };

inline std::string_view to_string(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::Moved:
      return "Moved";
    case OutcomeKind::Copied:
      return "Copied";
    case OutcomeKind::SkippedDuplicate:
      return "SkippedDuplicate";
    case OutcomeKind::DeletedDuplicate:
      return "DeletedDuplicate";
    case OutcomeKind::Failed:
      return "Failed";
  }
  return "Unknown";
}

struct TransferOutcome {
  fs::path source;
  fs::path destination;
  OutcomeKind kind = OutcomeKind::Failed;
  std::optional<ErrorKind> error;
  std::string reason;
};

struct RunSummary {
  std::size_t succeeded = 0;
  std::vector<fs::path> failed;
  std::vector<TransferOutcome> outcomes;

  bool ok() const { return failed.empty(); }

  std::size_t count(OutcomeKind kind) const {
    std::size_t n = 0;
    for (const auto& outcome : outcomes) {
      if (outcome.kind == kind) ++n;
    }
    return n;
  }
};

struct OrganizerOptions {
  fs::path target;
  LayoutPolicy layout;
  bool copy = false;
  bool delete_duplicates = false;
  bool dry_run = false;
  bool prefer_exif = false;
  std::uintmax_t max_hash_size = kDefaultMaxHashSize;
};

// On-disk configuration. Every key is optional.
struct Config {
  bool recursive = false;
  bool daily = false;
  bool no_year = false;
  bool copy = false;
  std::vector<std::string> endings;
  std::string exclude;
  bool exclude_regex = false;
  bool delete_duplicates = false;
  bool exif = false;
  bool progress = true;
  int verbosity = 0;
  std::uintmax_t max_hash_size_mb = kDefaultMaxHashSize / (1024 * 1024);
  std::string log_file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, recursive, daily,
                                                no_year, copy, endings,
                                                exclude, exclude_regex,
                                                delete_duplicates, exif,
                                                progress, verbosity,
                                                max_hash_size_mb, log_file);
