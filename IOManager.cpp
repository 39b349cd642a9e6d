#include "IOManager.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <mutex>
#include <print>

#include "utils.hpp"

namespace {
std::ofstream g_log_file;

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::atomic<LogLevel> g_log_level = LogLevel::Warning;

std::string_view level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

}  // namespace

bool IOManager::initialize_logger(const fs::path& logFile) {
  std::scoped_lock lock(log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
  if (logFile.empty()) {
    return true;
  }
  g_log_file.open(logFile, std::ios_base::app);
  return g_log_file.is_open();
}

void IOManager::set_log_level(LogLevel level) { g_log_level = level; }

LogLevel IOManager::log_level_for_verbosity(int verbosity) {
  if (verbosity <= 0) return LogLevel::Warning;
  if (verbosity == 1) return LogLevel::Info;
  return LogLevel::Debug;
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(LogLevel level, std::string_view message) {
  if (level < g_log_level.load()) {
    return;
  }

  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}", now);
  std::string full_message =
      std::format("{} | {} | {}", time_str, level_name(level), message);

  if (g_log_handler) {
    g_log_handler(full_message);
  } else {
    std::println(stderr, "{}", full_message);
  }

  if (g_log_file.is_open()) {
    g_log_file << full_message << "\n" << std::flush;
  }
}

void IOManager::log(std::string_view message) { log(LogLevel::Info, message); }

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  std::error_code ec;
  if (!fs::is_regular_file(configPath, ec)) {
    log(LogLevel::Error, std::format("Config file not found at {}",
                                     safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  if (!configFile) {
    log(LogLevel::Error, std::format("Cannot open config file {}",
                                     safe_path_to_string(configPath)));
    return std::nullopt;
  }
  try {
    json configJson = json::parse(configFile);
    if (!configJson.is_object()) {
      log(LogLevel::Error,
          std::format("Config file {} must contain a JSON object",
                      safe_path_to_string(configPath)));
      return std::nullopt;
    }
    Config config = configJson.get<Config>();
    if (config.max_hash_size_mb > kMaxHashSizeMb) {
      log(LogLevel::Error,
          std::format("max_hash_size_mb in {} is out of range: {}",
                      safe_path_to_string(configPath), config.max_hash_size_mb));
      return std::nullopt;
    }
    std::vector<std::string> endings;
    for (const auto& ending : config.endings) {
      if (auto normalized = normalize_extension(ending); !normalized.empty()) {
        endings.push_back(std::move(normalized));
      }
    }
    config.endings = std::move(endings);
    return config;
  } catch (const json::exception& e) {
    log(LogLevel::Error,
        std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

std::expected<void, ErrorKind> IOManager::ensure_directory(
    const fs::path& dir) {
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    log(LogLevel::Debug,
        std::format("Directory already exists: {}", safe_path_to_string(dir)));
    return {};
  }

  ec.clear();
  const bool created = fs::create_directories(dir, ec);
  if (ec) {
    // Lost a race against another creator: the directory is what we wanted.
    std::error_code check_ec;
    if (fs::is_directory(dir, check_ec)) {
      return {};
    }
    log(LogLevel::Error,
        std::format("[DIR] Failed to create directory '{}': {}",
                    safe_path_to_string(dir), ec.message()));
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
      return std::unexpected(ErrorKind::PermissionDenied);
    }
    return std::unexpected(ErrorKind::IOFailure);
  }
  if (created) {
    log(LogLevel::Info, std::format("Created missing directories for path: {}",
                                    safe_path_to_string(dir)));
  }
  return {};
}
