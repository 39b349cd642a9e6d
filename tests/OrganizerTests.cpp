#include <gtest/gtest.h>

#include <sys/resource.h>
#include <unistd.h>

#include <csignal>
#include <string>

#include "../Organizer.hpp"
#include "TestFixture.hpp"

namespace {
// Pins every file to one capture date, standing in for EXIF metadata.
class FixedDateExtractor : public DateExtractor {
 public:
  explicit FixedDateExtractor(CaptureDate date) : m_date(date) {}
  std::optional<CaptureDate> extract(const fs::path&) const override {
    return m_date;
  }

 private:
  CaptureDate m_date;
};

class CountingProgress : public ProgressReporter {
 public:
  void start(std::size_t n) override { total = n; }
  void advance(const fs::path&) override { ++ticks; }
  void finish() override { finished = true; }

  std::size_t total = 0;
  std::size_t ticks = 0;
  bool finished = false;
};

// Caps the size of regular files this process may write, so a copy of a
// larger file fails after the destination has been created.
class FileSizeLimit {
 public:
  explicit FileSizeLimit(rlim_t bytes) {
    ::getrlimit(RLIMIT_FSIZE, &m_saved);
    m_previous = std::signal(SIGXFSZ, SIG_IGN);
    rlimit limit = m_saved;
    limit.rlim_cur = bytes;
    ::setrlimit(RLIMIT_FSIZE, &limit);
  }
  ~FileSizeLimit() {
    ::setrlimit(RLIMIT_FSIZE, &m_saved);
    std::signal(SIGXFSZ, m_previous);
  }

 private:
  rlimit m_saved{};
  void (*m_previous)(int) = SIG_DFL;
};
}  // namespace

class OrganizerTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    source = test_dir / "source";
    target = test_dir / "organized";
    fs::create_directories(source);
  }

  OrganizerOptions Options() const {
    OrganizerOptions options;
    options.target = target;
    options.prefer_exif = true;
    return options;
  }

  std::vector<fs::path> SampleFiles() {
    return {CreateFile("source/file1.txt", "Test file 1"),
            CreateFile("source/file2.txt", "Test file 2")};
  }

  fs::path source;
  fs::path target;
  FixedDateExtractor extractor{CaptureDate{2023, 11, 14}};
  DateResolver resolver{&extractor};
};

TEST_F(OrganizerTest, MovesFilesIntoYearMonthFolders) {
  auto files = SampleFiles();
  Organizer organizer(Options(), resolver);

  RunSummary summary = organizer.organize(files);

  EXPECT_TRUE(fs::exists(target / "2023" / "11" / "file1.txt"));
  EXPECT_TRUE(fs::exists(target / "2023" / "11" / "file2.txt"));
  EXPECT_FALSE(fs::exists(files[0]));
  EXPECT_FALSE(fs::exists(files[1]));
  EXPECT_TRUE(summary.failed.empty());
  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_EQ(summary.count(OutcomeKind::Moved), 2u);
}

TEST_F(OrganizerTest, CopyModeKeepsOriginals) {
  auto files = SampleFiles();
  auto options = Options();
  options.copy = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize(files);

  EXPECT_EQ(ReadFile(target / "2023" / "11" / "file1.txt"), "Test file 1");
  EXPECT_EQ(ReadFile(target / "2023" / "11" / "file2.txt"), "Test file 2");
  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_TRUE(fs::exists(files[1]));
  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(summary.count(OutcomeKind::Copied), 2u);
}

TEST_F(OrganizerTest, CopyPreservesModificationTime) {
  auto file = CreateFile("source/old.jpg", "pixels");
  const auto stamp = fs::last_write_time(file) - std::chrono::hours(24 * 400);
  fs::last_write_time(file, stamp);
  auto options = Options();
  options.copy = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({file});

  ASSERT_TRUE(summary.ok());
  EXPECT_EQ(fs::last_write_time(target / "2023" / "11" / "old.jpg"), stamp);
}

TEST_F(OrganizerTest, DailyAndNoYearLayouts) {
  auto file = CreateFile("source/a.jpg");
  auto options = Options();
  options.layout = LayoutPolicy{true, false};
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({file});

  EXPECT_TRUE(summary.ok());
  EXPECT_TRUE(fs::exists(target / "2023-11" / "14" / "a.jpg"));
}

TEST_F(OrganizerTest, IdenticalDestinationIsSkippedWithoutFailure) {
  auto files = SampleFiles();
  auto existing = CreateFile("organized/2023/11/file1.txt", "Test file 1");
  Organizer organizer(Options(), resolver);

  RunSummary summary = organizer.organize({files[0]});

  EXPECT_TRUE(summary.failed.empty());
  EXPECT_EQ(summary.count(OutcomeKind::SkippedDuplicate), 1u);
  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_EQ(ReadFile(existing), "Test file 1");
}

TEST_F(OrganizerTest, IdenticalDestinationDeletesSourceWhenRequested) {
  auto files = SampleFiles();
  CreateFile("organized/2023/11/file1.txt", "Test file 1");
  auto options = Options();
  options.delete_duplicates = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({files[0]});

  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(summary.count(OutcomeKind::DeletedDuplicate), 1u);
  EXPECT_FALSE(fs::exists(files[0]));
  EXPECT_EQ(ReadFile(target / "2023" / "11" / "file1.txt"), "Test file 1");
}

TEST_F(OrganizerTest, DifferentDestinationIsAConflictAndNothingMoves) {
  auto files = SampleFiles();
  auto existing =
      CreateFile("organized/2023/11/file1.txt", "Different content");
  auto options = Options();
  options.delete_duplicates = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize(files);

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.failed[0], files[0]);
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::NameConflict);
  EXPECT_EQ(ReadFile(files[0]), "Test file 1");
  EXPECT_EQ(ReadFile(existing), "Different content");
  // The conflict does not stop the rest of the batch.
  EXPECT_TRUE(fs::exists(target / "2023" / "11" / "file2.txt"));
}

TEST_F(OrganizerTest, DryRunLeavesFilesystemUntouched) {
  auto files = SampleFiles();
  auto options = Options();
  options.dry_run = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize(files);

  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(summary.succeeded, 2u);
  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_TRUE(fs::exists(files[1]));
  EXPECT_FALSE(fs::exists(target / "2023" / "11" / "file1.txt"));
  EXPECT_TRUE(LogContains("[dry-run]"));
}

TEST_F(OrganizerTest, DryRunStillReportsConflicts) {
  auto files = SampleFiles();
  CreateFile("organized/2023/11/file1.txt", "Different content");
  auto options = Options();
  options.dry_run = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize(files);

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.failed[0], files[0]);
}

TEST_F(OrganizerTest, SecondRunOverReseededSourceOnlyFindsDuplicates) {
  auto files = SampleFiles();
  Organizer organizer(Options(), resolver);
  ASSERT_TRUE(organizer.organize(files).ok());

  files = SampleFiles();
  RunSummary second = organizer.organize(files);

  EXPECT_TRUE(second.ok());
  EXPECT_EQ(second.count(OutcomeKind::SkippedDuplicate), 2u);
  std::size_t organized = 0;
  for (const auto& entry : fs::recursive_directory_iterator(target)) {
    if (entry.is_regular_file()) ++organized;
  }
  EXPECT_EQ(organized, 2u);
}

TEST_F(OrganizerTest, TraversalPathFailsWithoutStoppingTheBatch) {
  auto good = CreateFile("source/good.jpg");
  Organizer organizer(Options(), resolver);

  RunSummary summary =
      organizer.organize({fs::path("../outside.jpg"), good});

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.failed[0], fs::path("../outside.jpg"));
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::InvalidPath);
  EXPECT_EQ(summary.outcomes[1].kind, OutcomeKind::Moved);
}

TEST_F(OrganizerTest, VanishedSourceIsRecordedAsFailure) {
  auto options = Options();
  options.prefer_exif = false;
  Organizer fs_only(options, resolver);

  RunSummary summary = fs_only.organize({source / "gone.jpg"});

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::IOFailure);
}

TEST_F(OrganizerTest, UnwritableDestinationIsPermissionDenied) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root bypasses directory permissions";
  }
  auto file = CreateFile("source/a.jpg");
  fs::create_directories(target / "2023" / "11");
  fs::permissions(target / "2023" / "11", fs::perms::owner_write,
                  fs::perm_options::remove);
  Organizer organizer(Options(), resolver);

  RunSummary summary = organizer.organize({file});

  fs::permissions(target / "2023" / "11", fs::perms::owner_write,
                  fs::perm_options::add);
  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::PermissionDenied);
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(OrganizerTest, ReportsProgressPerFile) {
  auto files = SampleFiles();
  CountingProgress progress;
  Organizer organizer(Options(), resolver, &progress);

  organizer.organize(files);

  EXPECT_EQ(progress.total, 2u);
  EXPECT_EQ(progress.ticks, 2u);
  EXPECT_TRUE(progress.finished);
}

TEST_F(OrganizerTest, RunFiltersByEndingAndLeavesOthersInSource) {
  CreateFile("source/photo1.jpg", "one");
  CreateFile("source/photo2.png", "two");
  auto notes = CreateFile("source/notes.txt", "text");
  FixedDateExtractor april{CaptureDate{2024, 4, 4}};
  DateResolver april_resolver(&april);
  ExtractionCriteria criteria;
  criteria.extensions = {".jpg", ".png"};
  Organizer organizer(Options(), april_resolver);

  auto summary = organizer.run(source, criteria);

  ASSERT_TRUE(summary.has_value());
  EXPECT_TRUE(summary->ok());
  EXPECT_TRUE(fs::exists(target / "2024" / "04" / "photo1.jpg"));
  EXPECT_TRUE(fs::exists(target / "2024" / "04" / "photo2.png"));
  EXPECT_TRUE(fs::exists(notes));
  EXPECT_FALSE(fs::exists(target / "2024" / "04" / "notes.txt"));
}

TEST_F(OrganizerTest, RunFailsWhenSourceIsMissing) {
  Organizer organizer(Options(), resolver);

  auto summary = organizer.run(test_dir / "nope", {});

  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), ErrorKind::SourceMissing);
  EXPECT_FALSE(fs::exists(target));
}

TEST_F(OrganizerTest, RunFailsOnInvalidPatternBeforeTouchingFiles) {
  auto files = SampleFiles();
  ExtractionCriteria criteria;
  criteria.exclusion = ExclusionMatcher{"(", true};
  Organizer organizer(Options(), resolver);

  auto summary = organizer.run(source, criteria);

  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), ErrorKind::InvalidPattern);
  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_FALSE(fs::exists(target));
}

TEST_F(OrganizerTest, EmptySourceSucceeds) {
  Organizer organizer(Options(), resolver);

  auto summary = organizer.run(source, {});

  ASSERT_TRUE(summary.has_value());
  EXPECT_TRUE(summary->ok());
  EXPECT_EQ(summary->succeeded, 0u);
}

TEST_F(OrganizerTest, RunAcceptsRelativeSourceAboveCwd) {
  auto photo = CreateFile("source/IMG_0001.jpg", "pixels");
  fs::create_directories(test_dir / "work");
  const fs::path previous = fs::current_path();
  fs::current_path(test_dir / "work");
  Organizer organizer(Options(), resolver);

  auto summary = organizer.run(fs::path("..") / "source", {});

  fs::current_path(previous);
  ASSERT_TRUE(summary.has_value());
  EXPECT_TRUE(summary->ok());
  EXPECT_EQ(summary->count(OutcomeKind::Moved), 1u);
  EXPECT_TRUE(fs::exists(target / "2023" / "11" / "IMG_0001.jpg"));
  EXPECT_FALSE(fs::exists(photo));
}

TEST_F(OrganizerTest, FailedCopyLeavesNoPartialFile) {
  auto file = CreateFile("source/burst.jpg", std::string(64 * 1024, 'x'));
  fs::create_directories(target / "2023" / "11");
  auto options = Options();
  options.copy = true;
  Organizer organizer(options, resolver);

  RunSummary summary;
  {
    FileSizeLimit limit(4096);
    summary = organizer.organize({file});
  }

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.outcomes[0].kind, OutcomeKind::Failed);
  EXPECT_FALSE(fs::exists(target / "2023" / "11" / "burst.jpg"));
  EXPECT_TRUE(fs::exists(file));

  // With the partial copy gone, a later run copies the file cleanly.
  RunSummary retry = organizer.organize({file});
  EXPECT_TRUE(retry.ok());
  EXPECT_EQ(retry.count(OutcomeKind::Copied), 1u);
}

TEST_F(OrganizerTest, FilesOverHashCapCountAsDuplicates) {
  auto file = CreateFile("source/clip.mov", "source bytes");
  auto existing = CreateFile("organized/2023/11/clip.mov", "other bytes");
  auto options = Options();
  options.max_hash_size = 4;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({file});

  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(summary.count(OutcomeKind::SkippedDuplicate), 1u);
  EXPECT_TRUE(fs::exists(file));
  EXPECT_EQ(ReadFile(existing), "other bytes");
}

TEST_F(OrganizerTest, FilesOverHashCapAreDeletedWhenRequested) {
  auto file = CreateFile("source/clip.mov", "source bytes");
  auto existing = CreateFile("organized/2023/11/clip.mov", "other bytes");
  auto options = Options();
  options.max_hash_size = 4;
  options.delete_duplicates = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({file});

  EXPECT_TRUE(summary.ok());
  EXPECT_EQ(summary.count(OutcomeKind::DeletedDuplicate), 1u);
  EXPECT_FALSE(fs::exists(file));
  EXPECT_EQ(ReadFile(existing), "other bytes");
}

TEST_F(OrganizerTest, SourceOverHashCapConflictsWithSmallDestination) {
  auto file = CreateFile("source/clip.mov", "source bytes");
  auto existing = CreateFile("organized/2023/11/clip.mov", "tiny");
  auto options = Options();
  options.max_hash_size = 4;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({file});

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::NameConflict);
  EXPECT_TRUE(fs::exists(file));
  EXPECT_EQ(ReadFile(existing), "tiny");
}

TEST_F(OrganizerTest, FailedDuplicateDeletionIsRecordedAsFailure) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root bypasses directory permissions";
  }
  auto files = SampleFiles();
  CreateFile("organized/2023/11/file1.txt", "Test file 1");
  auto options = Options();
  options.delete_duplicates = true;
  Organizer organizer(options, resolver);

  fs::permissions(source, fs::perms::owner_write, fs::perm_options::remove);
  RunSummary summary = organizer.organize({files[0]});
  fs::permissions(source, fs::perms::owner_write, fs::perm_options::add);

  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.outcomes[0].kind, OutcomeKind::Failed);
  EXPECT_EQ(summary.outcomes[0].error, ErrorKind::PermissionDenied);
  EXPECT_TRUE(fs::exists(files[0]));
}

TEST_F(OrganizerTest, LargeBatchKeepsInputOrder) {
  std::vector<fs::path> files;
  for (int i = 0; i < 300; ++i) {
    files.push_back(CreateFile(std::format("source/img_{:03}.jpg", i),
                               std::to_string(i)));
  }
  Organizer organizer(Options(), resolver);

  RunSummary summary = organizer.organize(files);

  EXPECT_TRUE(summary.ok());
  ASSERT_EQ(summary.outcomes.size(), files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    EXPECT_EQ(summary.outcomes[i].source, files[i]);
    EXPECT_EQ(summary.outcomes[i].kind, OutcomeKind::Moved);
  }
}

TEST_F(OrganizerTest, LogsEachFailedPath) {
  auto files = SampleFiles();
  CreateFile("organized/2023/11/file1.txt", "Different content");
  Organizer organizer(Options(), resolver);

  organizer.organize(files);

  EXPECT_TRUE(LogContains(
      std::format("ERROR | Failed to process {}", files[0].string())));
  EXPECT_FALSE(LogContains(
      std::format("Failed to process {}", files[1].string())));
}

TEST_F(OrganizerTest, DryRunChecksDestinationsClaimedEarlierInTheBatch) {
  auto first = CreateFile("source/a/IMG.jpg", "same");
  auto second = CreateFile("source/b/IMG.jpg", "same");
  auto third = CreateFile("source/c/IMG.jpg", "different");
  auto options = Options();
  options.dry_run = true;
  Organizer organizer(options, resolver);

  RunSummary summary = organizer.organize({first, second, third});

  ASSERT_EQ(summary.outcomes.size(), 3u);
  EXPECT_EQ(summary.outcomes[0].kind, OutcomeKind::Moved);
  EXPECT_EQ(summary.outcomes[1].kind, OutcomeKind::SkippedDuplicate);
  EXPECT_EQ(summary.outcomes[2].kind, OutcomeKind::Failed);
  EXPECT_EQ(summary.outcomes[2].error, ErrorKind::NameConflict);
  EXPECT_FALSE(fs::exists(target / "2023" / "11" / "IMG.jpg"));
  EXPECT_TRUE(fs::exists(first));
}
