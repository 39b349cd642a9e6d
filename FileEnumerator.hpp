#pragma once

#include <expected>
#include <vector>

#include "types.hpp"

namespace FileEnumerator {
// Lists regular files under `sourceRoot` that pass both the extension and the
// exclusion filter, sorted by path. A malformed exclusion regex fails with
// InvalidPattern before the tree is touched. An unreadable root, or a scan
// that fails partway through the tree, fails with IOFailure.
std::expected<std::vector<fs::path>, ErrorKind> enumerate(
    const fs::path& sourceRoot, const ExtractionCriteria& criteria);
}  // namespace FileEnumerator
