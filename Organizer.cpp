#include "Organizer.hpp"

#include <algorithm>
#include <execution>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include "DestinationPlanner.hpp"
#include "FileEnumerator.hpp"
#include "FileHasher.hpp"
#include "IOManager.hpp"
#include "PathSanitizer.hpp"
#include "utils.hpp"

namespace {
ErrorKind classify(const std::error_code& ec) {
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted ||
      ec == std::errc::read_only_file_system) {
    return ErrorKind::PermissionDenied;
  }
  return ErrorKind::IOFailure;
}

TransferOutcome failure(const fs::path& source, const fs::path& destination,
                        ErrorKind kind, std::string reason) {
  return TransferOutcome{source, destination, OutcomeKind::Failed, kind,
                         std::move(reason)};
}

bool directory_writable(const fs::path& dir) {
#if defined(_WIN32)
  std::error_code ec;
  const auto perms = fs::status(dir, ec).permissions();
  return !ec && (perms & fs::perms::owner_write) != fs::perms::none;
#else
  return ::access(dir.c_str(), W_OK) == 0;
#endif
}

// copy_file does not carry timestamps over; the permission bits and the
// modification time are applied afterwards. A copy that fails partway is
// removed so no truncated file is left at the destination.
std::error_code copy_with_metadata(const fs::path& source,
                                   const fs::path& destination) {
  std::error_code ec;
  fs::copy_file(source, destination, fs::copy_options::none, ec);
  if (ec) {
    if (ec != std::errc::file_exists) {
      std::error_code undo_ec;
      fs::remove(destination, undo_ec);
      if (undo_ec) {
        IOManager::log(LogLevel::Error,
                       std::format("Could not remove partial copy '{}': {}",
                                   safe_path_to_string(destination),
                                   undo_ec.message()));
      }
    }
    return ec;
  }

  std::error_code meta_ec;
  const auto mtime = fs::last_write_time(source, meta_ec);
  if (!meta_ec) fs::last_write_time(destination, mtime, meta_ec);
  if (!meta_ec) {
    const auto perms = fs::status(source, meta_ec).permissions();
    if (!meta_ec) fs::permissions(destination, perms, meta_ec);
  }
  if (meta_ec) {
    IOManager::log(LogLevel::Warning,
                   std::format("Could not preserve metadata on '{}': {}",
                               safe_path_to_string(destination),
                               meta_ec.message()));
  }
  return {};
}
}  // namespace

Organizer::Organizer(OrganizerOptions options, const DateResolver& resolver,
                     ProgressReporter* progress)
    : m_options(std::move(options)),
      m_resolver(resolver),
      m_progress(progress) {}

std::expected<RunSummary, ErrorKind> Organizer::run(
    const fs::path& source, const ExtractionCriteria& criteria) const {
  IOManager::log("Starting file sorting process");

  std::error_code ec;
  if (!fs::is_directory(source, ec)) {
    IOManager::log(LogLevel::Error,
                   std::format("Source directory '{}' does not exist.",
                               safe_path_to_string(source)));
    return std::unexpected(ErrorKind::SourceMissing);
  }

  // Candidates must be absolute: a relative root such as "../photos" would
  // otherwise hand the sanitizer paths with a leading "..".
  const fs::path root = fs::absolute(source, ec).lexically_normal();
  if (ec) {
    IOManager::log(LogLevel::Error,
                   std::format("Cannot resolve source directory '{}': {}",
                               safe_path_to_string(source), ec.message()));
    return std::unexpected(ErrorKind::SourceMissing);
  }

  auto files = FileEnumerator::enumerate(root, criteria);
  if (!files) {
    return std::unexpected(files.error());
  }

  if (auto made = IOManager::ensure_directory(m_options.target); !made) {
    return std::unexpected(made.error());
  }

  return organize(*files);
}

RunSummary Organizer::organize(const std::vector<fs::path>& files) const {
  IOManager::log(std::format("Found {} files. Analyzing...", files.size()));

  // Analysis only reads, so it runs in parallel; the results keep input order.
  std::vector<Analysis> analyses(files.size());
  for (std::size_t i = 0; i < files.size(); i += kAnalysisChunkSize) {
    const auto chunk_end =
        files.begin() + std::min(i + kAnalysisChunkSize, files.size());
    std::transform(std::execution::par, files.begin() + i, chunk_end,
                   analyses.begin() + i,
                   [this](const fs::path& file) { return analyze(file); });
  }

  NullProgress silent;
  ProgressReporter& progress = m_progress ? *m_progress : silent;
  progress.start(analyses.size());

  RunSummary summary;
  summary.outcomes.reserve(analyses.size());

  // Sequential I/O loop: one file's mutations finish before the next starts.
  PlannedTransfers planned;
  for (const auto& analysis : analyses) {
    TransferOutcome outcome = execute(analysis, planned);
    if (outcome.kind == OutcomeKind::Failed) {
      summary.failed.push_back(outcome.source);
    } else {
      ++summary.succeeded;
    }
    summary.outcomes.push_back(std::move(outcome));
    progress.advance(analysis.source);
  }
  progress.finish();

  IOManager::log(std::format("Processed {} files: {} succeeded, {} failed",
                             files.size(), summary.succeeded,
                             summary.failed.size()));
  for (const auto& failed : summary.failed) {
    IOManager::log(LogLevel::Error, std::format("Failed to process {}",
                                                safe_path_to_string(failed)));
  }
  return summary;
}

Organizer::Analysis Organizer::analyze(const fs::path& file) const {
  Analysis analysis;
  analysis.source = file;
  analysis.sanitized = PathSanitizer::sanitize(file);
  if (analysis.sanitized) {
    analysis.date =
        m_resolver.resolve(*analysis.sanitized, m_options.prefer_exif);
  }
  return analysis;
}

TransferOutcome Organizer::execute(const Analysis& analysis,
                                   PlannedTransfers& planned) const {
  if (!analysis.sanitized) {
    IOManager::log(LogLevel::Error,
                   std::format("Rejected unsafe path '{}'",
                               safe_path_to_string(analysis.source)));
    return failure(analysis.source, {}, ErrorKind::InvalidPath,
                   "path contains a traversal sequence");
  }
  const fs::path& source = *analysis.sanitized;

  if (!analysis.date) {
    return failure(analysis.source, {}, analysis.date.error(),
                   "cannot determine capture date");
  }

  const fs::path folder = DestinationPlanner::plan(
      m_options.target, *analysis.date, m_options.layout);
  if (auto made = IOManager::ensure_directory(folder); !made) {
    return failure(analysis.source, folder, made.error(),
                   "cannot create destination directory");
  }

  const fs::path destination = folder / source.filename();

  // A dry run leaves the target as it was, so destinations claimed earlier in
  // the batch stand in for files that a real run would find there.
  if (m_options.dry_run) {
    if (auto it = planned.find(destination); it != planned.end()) {
      TransferOutcome outcome = handle_existing(source, destination, it->second);
      outcome.source = analysis.source;
      return outcome;
    }
  }

  std::error_code ec;
  const bool exists = fs::exists(fs::symlink_status(destination, ec));
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return failure(analysis.source, destination, classify(ec), ec.message());
  }

  TransferOutcome outcome =
      exists ? handle_existing(source, destination, destination)
             : transfer(source, destination);
  if (m_options.dry_run && (outcome.kind == OutcomeKind::Moved ||
                            outcome.kind == OutcomeKind::Copied)) {
    planned.emplace(destination, source);
  }
  outcome.source = analysis.source;
  return outcome;
}

TransferOutcome Organizer::handle_existing(const fs::path& source,
                                           const fs::path& destination,
                                           const fs::path& occupant) const {
  std::error_code ec;
  if (fs::equivalent(source, occupant, ec)) {
    IOManager::log(LogLevel::Info,
                   std::format("File '{}' is already in place. Skipping.",
                               safe_path_to_string(source)));
    return TransferOutcome{source, destination, OutcomeKind::SkippedDuplicate,
                           std::nullopt, "already organized"};
  }

  const auto source_hash = FileHasher::hash(source, m_options.max_hash_size);
  const auto destination_hash =
      FileHasher::hash(occupant, m_options.max_hash_size);
  if (!source_hash || !destination_hash) {
    IOManager::log(LogLevel::Error,
                   std::format("Cannot compare '{}' with existing '{}'",
                               safe_path_to_string(source),
                               safe_path_to_string(destination)));
    return failure(source, destination, ErrorKind::HashFailure,
                   "fingerprinting failed");
  }

  if (*source_hash != *destination_hash) {
    IOManager::log(
        LogLevel::Error,
        std::format("File '{}' already exists and is different. Skipping.",
                    safe_path_to_string(destination)));
    return failure(source, destination, ErrorKind::NameConflict,
                   "destination exists with different content");
  }

  if (!m_options.delete_duplicates) {
    IOManager::log(
        LogLevel::Warning,
        std::format("File '{}' already exists and is identical. Skipping.",
                    safe_path_to_string(destination)));
    return TransferOutcome{source, destination, OutcomeKind::SkippedDuplicate,
                           std::nullopt, "identical file already present"};
  }

  if (m_options.dry_run) {
    IOManager::log(std::format("[dry-run] Would delete duplicate '{}'",
                               safe_path_to_string(source)));
  } else {
    fs::remove(source, ec);
    if (ec) {
      IOManager::log(LogLevel::Error,
                     std::format("Failed to delete duplicate '{}': {}",
                                 safe_path_to_string(source), ec.message()));
      return failure(source, destination, classify(ec), ec.message());
    }
    IOManager::log(std::format("Deleted duplicate '{}'",
                               safe_path_to_string(source)));
  }
  return TransferOutcome{source, destination, OutcomeKind::DeletedDuplicate,
                         std::nullopt, "identical file already present"};
}

TransferOutcome Organizer::transfer(const fs::path& source,
                                    const fs::path& destination) const {
  const OutcomeKind done =
      m_options.copy ? OutcomeKind::Copied : OutcomeKind::Moved;
  const std::string_view verb = m_options.copy ? "copy" : "move";

  if (!directory_writable(destination.parent_path())) {
    IOManager::log(LogLevel::Error,
                   std::format("No write permission for '{}'",
                               safe_path_to_string(destination.parent_path())));
    return failure(source, destination, ErrorKind::PermissionDenied,
                   "destination directory is not writable");
  }

  if (m_options.dry_run) {
    IOManager::log(std::format("[dry-run] Would {} '{}' to '{}'", verb,
                               safe_path_to_string(source),
                               safe_path_to_string(destination)));
    return TransferOutcome{source, destination, done, std::nullopt, "dry run"};
  }

  std::error_code ec;
  if (m_options.copy) {
    ec = copy_with_metadata(source, destination);
  } else {
    fs::rename(source, destination, ec);
    if (ec == std::errc::cross_device_link) {
      ec = copy_with_metadata(source, destination);
      if (!ec) {
        fs::remove(source, ec);
        if (ec) {
          // Roll back so the file exists in exactly one place.
          std::error_code undo_ec;
          fs::remove(destination, undo_ec);
        }
      }
    }
  }

  if (ec) {
    IOManager::log(LogLevel::Error,
                   std::format("Failed to {} '{}' to '{}': {}", verb,
                               safe_path_to_string(source),
                               safe_path_to_string(destination), ec.message()));
    return failure(source, destination, classify(ec), ec.message());
  }

  IOManager::log(std::format("{} '{}' to '{}'",
                             m_options.copy ? "Copied" : "Moved",
                             safe_path_to_string(source),
                             safe_path_to_string(destination)));
  return TransferOutcome{source, destination, done, std::nullopt, {}};
}
