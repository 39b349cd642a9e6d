#pragma once

#include "types.hpp"

namespace DestinationPlanner {
// target/YYYY/MM[/DD] or target/YYYY-MM[/DD]. Never touches the filesystem.
fs::path plan(const fs::path& targetRoot, const CaptureDate& date,
              const LayoutPolicy& layout);
}  // namespace DestinationPlanner
