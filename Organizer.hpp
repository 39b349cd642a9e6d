#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <vector>

#include "DateResolver.hpp"
#include "ProgressReporter.hpp"
#include "types.hpp"

class Organizer {
 public:
  // `progress` may be null. `resolver` must outlive the organizer.
  Organizer(OrganizerOptions options, const DateResolver& resolver,
            ProgressReporter* progress = nullptr);

  // Validates the source, prepares the target root, enumerates candidates and
  // organizes them. Fails before touching any file when the source is missing
  // or the exclusion pattern is invalid.
  std::expected<RunSummary, ErrorKind> run(
      const fs::path& source, const ExtractionCriteria& criteria) const;

  // Processes the given files in order; every file ends with exactly one
  // outcome in the summary.
  RunSummary organize(const std::vector<fs::path>& files) const;

  const OrganizerOptions& options() const { return m_options; }

 private:
  struct Analysis {
    fs::path source;
    std::expected<fs::path, ErrorKind> sanitized =
        std::unexpected(ErrorKind::InvalidPath);
    std::expected<CaptureDate, ErrorKind> date =
        std::unexpected(ErrorKind::IOFailure);
  };

  // Destination -> source that a dry run would have placed there.
  using PlannedTransfers = std::map<fs::path, fs::path>;

  static constexpr std::size_t kAnalysisChunkSize = 128;

  Analysis analyze(const fs::path& file) const;
  TransferOutcome execute(const Analysis& analysis,
                          PlannedTransfers& planned) const;
  // `occupant` holds the content found at `destination`.
  TransferOutcome handle_existing(const fs::path& source,
                                  const fs::path& destination,
                                  const fs::path& occupant) const;
  TransferOutcome transfer(const fs::path& source,
                           const fs::path& destination) const;

  OrganizerOptions m_options;
  const DateResolver& m_resolver;
  ProgressReporter* m_progress;
};
