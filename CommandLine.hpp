#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

struct CliArguments {
  fs::path source;
  fs::path target;
  bool help = false;

  bool recursive = false;
  bool daily = false;
  bool copy = false;
  bool no_year = false;
  bool exclude_regex = false;
  bool no_progress = false;
  bool delete_duplicates = false;
  bool dry_run = false;
  bool exif = false;
  int verbosity = 0;

  std::optional<std::vector<std::string>> endings;
  std::optional<std::string> exclude;
  std::optional<fs::path> config;
  std::optional<fs::path> log_file;
  std::optional<std::uintmax_t> max_hash_size_mb;
};

namespace CommandLine {
// Returns an error message for unknown options, missing option values or a
// wrong number of positional arguments.
std::expected<CliArguments, std::string> parse(
    const std::vector<std::string>& args);
std::expected<CliArguments, std::string> parse(int argc, char* argv[]);

std::string usage(std::string_view program);

// Flags can only switch booleans on; list and value options replace the
// configured value when given.
Config merge(Config base, const CliArguments& args);

ExtractionCriteria criteria_from(const Config& config);
OrganizerOptions options_from(const Config& config, const fs::path& target);
}  // namespace CommandLine
