#include "FileEnumerator.hpp"

#include <algorithm>
#include <regex>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
struct CompiledExclusion {
  std::regex expression;
  bool anchored = false;

  bool matches(const std::string& basename) const {
    return anchored ? std::regex_match(basename, expression)
                    : std::regex_search(basename, expression);
  }
};

bool has_allowed_extension(const std::string& basename,
                           const std::vector<std::string>& extensions) {
  if (extensions.empty()) {
    return true;
  }
  return std::any_of(extensions.begin(), extensions.end(),
                     [&](const std::string& ext) {
                       return ends_with_ascii_ci(basename, ext);
                     });
}

// Returns the error of the first failed increment, which ends the scan.
template <typename Iterator>
std::error_code collect(Iterator it, const ExtractionCriteria& criteria,
                        const std::optional<CompiledExclusion>& exclusion,
                        std::vector<fs::path>& out) {
  const Iterator end{};
  while (it != end) {
    const auto& entry = *it;
    std::error_code type_ec;
    const bool regular = entry.is_regular_file(type_ec) && !type_ec;
    const std::string basename = safe_path_to_string(entry.path().filename());

    if (regular && has_allowed_extension(basename, criteria.extensions)) {
      if (exclusion && exclusion->matches(basename)) {
        IOManager::log(LogLevel::Debug,
                       std::format("Excluded by pattern: {}",
                                   safe_path_to_string(entry.path())));
      } else {
        out.push_back(entry.path());
      }
    }

    std::error_code ec;
    it.increment(ec);
    if (ec) {
      return ec;
    }
  }
  return {};
}
}  // namespace

std::expected<std::vector<fs::path>, ErrorKind> FileEnumerator::enumerate(
    const fs::path& sourceRoot, const ExtractionCriteria& criteria) {
  std::optional<CompiledExclusion> exclusion;
  if (criteria.exclusion && !criteria.exclusion->pattern.empty()) {
    const auto& matcher = *criteria.exclusion;
    try {
      if (matcher.is_regex) {
        exclusion = CompiledExclusion{std::regex(matcher.pattern), false};
      } else {
        exclusion =
            CompiledExclusion{std::regex(glob_to_regex(matcher.pattern)), true};
      }
    } catch (const std::regex_error& e) {
      IOManager::log(LogLevel::Error,
                     std::format("Invalid exclusion pattern '{}': {}",
                                 matcher.pattern, e.what()));
      return std::unexpected(ErrorKind::InvalidPattern);
    }
  }

  std::vector<fs::path> files;
  std::error_code ec;
  const auto options = fs::directory_options::skip_permission_denied;
  if (criteria.recursive) {
    fs::recursive_directory_iterator it(sourceRoot, options, ec);
    if (!ec) ec = collect(std::move(it), criteria, exclusion, files);
  } else {
    fs::directory_iterator it(sourceRoot, options, ec);
    if (!ec) ec = collect(std::move(it), criteria, exclusion, files);
  }
  if (ec) {
    IOManager::log(LogLevel::Error,
                   std::format("Error during directory scan of '{}': {}",
                               safe_path_to_string(sourceRoot), ec.message()));
    return std::unexpected(ErrorKind::IOFailure);
  }

  std::sort(files.begin(), files.end());
  IOManager::log(LogLevel::Debug,
                 std::format("Listed {} files from {}, excluding pattern: {}",
                             files.size(), safe_path_to_string(sourceRoot),
                             criteria.exclusion ? criteria.exclusion->pattern
                                                : std::string("None")));
  return files;
}
