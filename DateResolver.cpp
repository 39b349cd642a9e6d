#include "DateResolver.hpp"

#include <sys/stat.h>

#include <charconv>
#include <ctime>
#include <exiv2/exiv2.hpp>
#include <mutex>

#if defined(__linux__)
#include <fcntl.h>
#endif

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

constexpr const char* kExifDateKeys[] = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime",
};

template <typename T>
bool parse_number(std::string_view text, T& out) {
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

#if defined(__linux__) && defined(STATX_BTIME)
// Birth time through statx; not every filesystem records it.
std::optional<std::time_t> birth_time(const fs::path& path) {
  struct statx stx {};
  if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME,
              &stx) != 0) {
    return std::nullopt;
  }
  if ((stx.stx_mask & STATX_BTIME) == 0 || stx.stx_btime.tv_sec == 0) {
    return std::nullopt;
  }
  return static_cast<std::time_t>(stx.stx_btime.tv_sec);
}
#elif defined(__APPLE__)
std::optional<std::time_t> birth_time(const fs::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) return std::nullopt;
  return static_cast<std::time_t>(st.st_birthtimespec.tv_sec);
}
#else
std::optional<std::time_t> birth_time(const fs::path&) { return std::nullopt; }
#endif

std::optional<CaptureDate> local_date(std::time_t when) {
  std::tm tm{};
#if defined(_WIN32)
  if (localtime_s(&tm, &when) != 0) return std::nullopt;
#else
  if (localtime_r(&when, &tm) == nullptr) return std::nullopt;
#endif
  return CaptureDate{tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                     static_cast<unsigned>(tm.tm_mday)};
}
}  // namespace

std::optional<CaptureDate> parse_exif_date(std::string_view value) {
  value = value.substr(0, 10);
  if (value.size() != 10) return std::nullopt;
  const char sep = value[4];
  if ((sep != ':' && sep != '-') || value[7] != sep) return std::nullopt;

  CaptureDate date;
  if (!parse_number(value.substr(0, 4), date.year) ||
      !parse_number(value.substr(5, 2), date.month) ||
      !parse_number(value.substr(8, 2), date.day)) {
    return std::nullopt;
  }
  // Cameras without a clock write "0000:00:00".
  if (date.year == 0 || date.month < 1 || date.month > 12 || date.day < 1 ||
      date.day > 31) {
    return std::nullopt;
  }
  return date;
}

std::optional<CaptureDate> ExifDateExtractor::extract(
    const fs::path& path) const {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    for (const char* key : kExifDateKeys) {
      auto it = exifData.findKey(Exiv2::ExifKey(key));
      if (it == exifData.end() || it->count() == 0) continue;
      if (auto date = parse_exif_date(it->toString())) {
        return date;
      }
      IOManager::log(LogLevel::Debug,
                     std::format("Malformed {} in '{}': {}", key,
                                 safe_path_to_string(path), it->toString()));
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(LogLevel::Debug,
                   std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        LogLevel::Debug,
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}

DateResolver::DateResolver(const DateExtractor* extractor)
    : m_extractor(extractor) {}

std::expected<CaptureDate, ErrorKind> DateResolver::resolve(
    const fs::path& path, bool preferExternalMetadata) const {
  if (preferExternalMetadata && m_extractor != nullptr) {
    if (auto date = m_extractor->extract(path)) {
      IOManager::log(LogLevel::Debug,
                     std::format("File {} metadata date: {}",
                                 safe_path_to_string(path), date->to_string()));
      return *date;
    }
  }
  return filesystem_date(path);
}

std::expected<CaptureDate, ErrorKind> DateResolver::filesystem_date(
    const fs::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    IOManager::log(LogLevel::Error,
                   std::format("Cannot read timestamps of {}",
                               safe_path_to_string(path)));
    return std::unexpected(ErrorKind::IOFailure);
  }

  const std::time_t when = birth_time(path).value_or(st.st_mtime);
  auto date = local_date(when);
  if (!date) {
    return std::unexpected(ErrorKind::IOFailure);
  }
  IOManager::log(LogLevel::Debug,
                 std::format("File {} creation date: {}",
                             safe_path_to_string(path), date->to_string()));
  return *date;
}
