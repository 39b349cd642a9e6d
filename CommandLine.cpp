#include "CommandLine.hpp"

#include <cctype>
#include <charconv>
#include <format>

#include "utils.hpp"

namespace {
bool is_option_token(const std::string& candidate) {
  if (candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool all_v(std::string_view flags) {
  return !flags.empty() &&
         flags.find_first_not_of('v') == std::string_view::npos;
}
}  // namespace

std::expected<CliArguments, std::string> CommandLine::parse(int argc,
                                                            char* argv[]) {
  std::vector<std::string> args;
  if (argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args);
}

std::expected<CliArguments, std::string> CommandLine::parse(
    const std::vector<std::string>& args) {
  CliArguments out;
  std::vector<std::string> positionals;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= args.size() || is_option_token(args[i + 1])) {
        return std::nullopt;
      }
      return args[++i];
    };

    if (!is_option_token(token)) {
      positionals.push_back(token);
    } else if (token == "-h" || token == "--help") {
      out.help = true;
    } else if (token == "-r" || token == "--recursive") {
      out.recursive = true;
    } else if (token == "-d" || token == "--daily") {
      out.daily = true;
    } else if (token == "-c" || token == "--copy") {
      out.copy = true;
    } else if (token == "--no-year") {
      out.no_year = true;
    } else if (token == "--exclude-regex") {
      out.exclude_regex = true;
    } else if (token == "--no-progress") {
      out.no_progress = true;
    } else if (token == "--delete-duplicates") {
      out.delete_duplicates = true;
    } else if (token == "--dry-run") {
      out.dry_run = true;
    } else if (token == "--exif") {
      out.exif = true;
    } else if (token == "--verbose") {
      ++out.verbosity;
    } else if (token[0] == '-' && token[1] != '-' &&
               all_v(std::string_view(token).substr(1))) {
      out.verbosity += static_cast<int>(token.size() - 1);
    } else if (token == "-e" || token == "--endings") {
      std::vector<std::string> endings;
      while (i + 1 < args.size() && !is_option_token(args[i + 1])) {
        if (auto ext = normalize_extension(args[++i]); !ext.empty()) {
          endings.push_back(std::move(ext));
        }
      }
      out.endings = std::move(endings);
    } else if (token == "--exclude") {
      auto value = take_value();
      if (!value) return std::unexpected("--exclude requires a pattern");
      out.exclude = *value;
    } else if (token == "--config") {
      auto value = take_value();
      if (!value) return std::unexpected("--config requires a file path");
      out.config = fs::path(*value);
    } else if (token == "--log-file") {
      auto value = take_value();
      if (!value) return std::unexpected("--log-file requires a file path");
      out.log_file = fs::path(*value);
    } else if (token == "--max-hash-size") {
      auto value = take_value();
      std::uintmax_t megabytes = 0;
      if (!value) return std::unexpected("--max-hash-size requires a number");
      const auto [ptr, ec] = std::from_chars(
          value->data(), value->data() + value->size(), megabytes);
      if (ec != std::errc() || ptr != value->data() + value->size() ||
          megabytes > kMaxHashSizeMb) {
        return std::unexpected(
            std::format("Invalid --max-hash-size value '{}'", *value));
      }
      out.max_hash_size_mb = megabytes;
    } else {
      return std::unexpected(std::format("Unknown option {}", token));
    }
  }

  if (out.help) {
    return out;
  }
  if (positionals.size() != 2) {
    return std::unexpected(std::format(
        "Expected <source> and <target>, got {} positional argument(s)",
        positionals.size()));
  }
  out.source = fs::path(positionals[0]);
  out.target = fs::path(positionals[1]);
  return out;
}

std::string CommandLine::usage(std::string_view program) {
  return std::format(
      "Usage: {} [options] <source> <target>\n"
      "\n"
      "Sort photos from source to target directory by capture date.\n"
      "\n"
      "Options:\n"
      "  -r, --recursive          Sort photos recursively\n"
      "  -d, --daily              Folder structure with daily folders\n"
      "  -e, --endings <ext...>   File endings to process (e.g. .jpg .png)\n"
      "  -c, --copy               Copy files instead of moving them\n"
      "      --no-year            Use YYYY-MM folders instead of YYYY/MM\n"
      "      --exclude <pattern>  Exclude files whose name matches a glob\n"
      "      --exclude-regex      Treat --exclude as a regular expression\n"
      "      --delete-duplicates  Delete source files already present in target\n"
      "      --dry-run            Report what would happen without changes\n"
      "      --exif               Prefer EXIF capture dates\n"
      "      --no-progress        Do not show the progress bar\n"
      "      --max-hash-size <MiB> Skip digests above this size (0: never)\n"
      "      --config <file>      Read defaults from a JSON config file\n"
      "      --log-file <file>    Append log output to a file\n"
      "  -v                       Increase verbosity (repeatable)\n"
      "  -h, --help               Show this help\n",
      program);
}

Config CommandLine::merge(Config base, const CliArguments& args) {
  base.recursive = base.recursive || args.recursive;
  base.daily = base.daily || args.daily;
  base.copy = base.copy || args.copy;
  base.no_year = base.no_year || args.no_year;
  base.exclude_regex = base.exclude_regex || args.exclude_regex;
  base.delete_duplicates = base.delete_duplicates || args.delete_duplicates;
  base.exif = base.exif || args.exif;
  if (args.no_progress) base.progress = false;
  if (args.verbosity > 0) base.verbosity = args.verbosity;
  if (args.endings) base.endings = *args.endings;
  if (args.exclude) base.exclude = *args.exclude;
  if (args.log_file) base.log_file = safe_path_to_string(*args.log_file);
  if (args.max_hash_size_mb) base.max_hash_size_mb = *args.max_hash_size_mb;
  return base;
}

ExtractionCriteria CommandLine::criteria_from(const Config& config) {
  ExtractionCriteria criteria;
  criteria.recursive = config.recursive;
  for (const auto& ending : config.endings) {
    if (auto ext = normalize_extension(ending); !ext.empty()) {
      criteria.extensions.push_back(std::move(ext));
    }
  }
  if (!config.exclude.empty()) {
    criteria.exclusion = ExclusionMatcher{config.exclude, config.exclude_regex};
  }
  return criteria;
}

OrganizerOptions CommandLine::options_from(const Config& config,
                                           const fs::path& target) {
  OrganizerOptions options;
  options.target = target;
  options.layout.daily_folders = config.daily;
  options.layout.year_as_separate_level = !config.no_year;
  options.copy = config.copy;
  options.delete_duplicates = config.delete_duplicates;
  options.prefer_exif = config.exif;
  options.max_hash_size = config.max_hash_size_mb * 1024 * 1024;
  return options;
}
