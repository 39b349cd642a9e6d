#include <exception>
#include <exiv2/exiv2.hpp>
#include <memory>
#include <print>
#include <vector>

#include "CommandLine.hpp"
#include "DateResolver.hpp"
#include "IOManager.hpp"
#include "Organizer.hpp"
#include "ProgressReporter.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
constexpr const char* kConfigFileName = "photo-organizer.json";

// An explicit --config must load; otherwise the first config found next to
// the executable or in the working directory is used, and defaults apply
// when there is none.
std::optional<Config> resolve_config(const CliArguments& args,
                                     const fs::path& exePath) {
  if (args.config) {
    return IOManager::load_config(*args.config);
  }

  std::vector<fs::path> configPaths = {exePath / kConfigFileName,
                                       fs::current_path() / kConfigFileName};
  for (const auto& configPath : configPaths) {
    std::error_code ec;
    if (fs::is_regular_file(configPath, ec)) {
      IOManager::log(LogLevel::Debug,
                     std::format("Found config at: {}",
                                 safe_path_to_string(configPath)));
      return IOManager::load_config(configPath);
    }
  }
  return Config{};
}

int run(int argc, char* argv[]) {
  const std::string program =
      argc > 0 ? fs::path(argv[0]).filename().string() : "photo-organizer";

  auto parsed = CommandLine::parse(argc, argv);
  if (!parsed) {
    std::println(stderr, "{}\n", parsed.error());
    std::print(stderr, "{}", CommandLine::usage(program));
    return 2;
  }
  const CliArguments& args = *parsed;
  if (args.help) {
    std::print("{}", CommandLine::usage(program));
    return 0;
  }

  IOManager::set_log_level(IOManager::log_level_for_verbosity(args.verbosity));

  fs::path exePath = argc > 0 ? fs::path(argv[0]).parent_path() : fs::path{};
  if (exePath.empty()) {
    exePath = fs::current_path();
  }

  auto configOpt = resolve_config(args, exePath);
  if (!configOpt) {
    IOManager::log(LogLevel::Error, "Failed to load configuration.");
    return 1;
  }
  const Config config = CommandLine::merge(*configOpt, args);

  IOManager::set_log_level(IOManager::log_level_for_verbosity(config.verbosity));
  if (!config.log_file.empty() &&
      !IOManager::initialize_logger(fs::path(config.log_file))) {
    IOManager::log(LogLevel::Warning,
                   std::format("Cannot open log file {}", config.log_file));
  }

  OrganizerOptions options = CommandLine::options_from(config, args.target);
  options.dry_run = args.dry_run;
  if (options.dry_run) {
    IOManager::log(LogLevel::Warning,
                   "Dry run: no file will be moved, copied or deleted.");
  }

  std::unique_ptr<DateExtractor> extractor;
  if (options.prefer_exif) {
    extractor = std::make_unique<ExifDateExtractor>();
  }
  DateResolver resolver(extractor.get());

  std::unique_ptr<ProgressReporter> progress;
  if (config.progress) {
    progress = std::make_unique<TerminalProgress>();
  } else {
    progress = std::make_unique<NullProgress>();
  }

  Organizer organizer(options, resolver, progress.get());
  auto summary = organizer.run(args.source, CommandLine::criteria_from(config));
  if (!summary) {
    IOManager::log(LogLevel::Error, std::format("Run aborted: {}",
                                                to_string(summary.error())));
    return 1;
  }

  std::println("{} file(s) processed successfully, {} failed.",
               summary->succeeded, summary->failed.size());
  return summary->ok() ? 0 : 1;
}
}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);

  int exitCode = 1;
  try {
    exitCode = run(argc, argv);
  } catch (const std::exception& e) {
    IOManager::log(LogLevel::Error, std::format("FATAL EXCEPTION: {}", e.what()));
    exitCode = 1;
  }

  Exiv2::XmpParser::terminate();
  return exitCode;
}
