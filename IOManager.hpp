#pragma once

#include <expected>
#include <functional>
#include <optional>
#include <string_view>

#include "types.hpp"

enum class LogLevel { Debug, Info, Warning, Error };

namespace IOManager {
// Opens (appending) an additional log file. An empty path closes it.
bool initialize_logger(const fs::path& logFile = {});

void set_log_level(LogLevel level);
LogLevel log_level_for_verbosity(int verbosity);

// The handler receives every formatted line that passes the level filter.
// While a handler is installed, lines are not written to stderr.
void set_log_handler(std::function<void(std::string_view)> handler);

void log(LogLevel level, std::string_view message);
void log(std::string_view message);

std::optional<Config> load_config(const fs::path& configPath);

// Creates every missing segment of `dir`. Succeeds when the directory is
// already there, including when another caller created it concurrently.
std::expected<void, ErrorKind> ensure_directory(const fs::path& dir);
}  // namespace IOManager
