#include "DestinationPlanner.hpp"

#include <format>

fs::path DestinationPlanner::plan(const fs::path& targetRoot,
                                  const CaptureDate& date,
                                  const LayoutPolicy& layout) {
  fs::path folder = targetRoot;
  if (layout.year_as_separate_level) {
    folder /= std::format("{}", date.year);
    folder /= std::format("{:02}", date.month);
  } else {
    folder /= std::format("{}-{:02}", date.year, date.month);
  }
  if (layout.daily_folders) {
    folder /= std::format("{:02}", date.day);
  }
  return folder;
}
