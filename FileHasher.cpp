#include "FileHasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

std::string hex_from_bytes(const unsigned char* bytes, unsigned int length) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out += kDigits[bytes[i] >> 4];
    out += kDigits[bytes[i] & 0x0F];
  }
  return out;
}
}  // namespace

std::optional<std::string> FileHasher::hash(const fs::path& path,
                                            std::uintmax_t maxSizeBytes) {
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec) {
    IOManager::log(LogLevel::Error,
                   std::format("Error hashing file {}: {}",
                               safe_path_to_string(path), ec.message()));
    return std::nullopt;
  }
  if (maxSizeBytes != 0 && size > maxSizeBytes) {
    IOManager::log(LogLevel::Debug,
                   std::format("Skipping digest of {} ({} bytes over cap)",
                               safe_path_to_string(path), size));
    return std::string(kLargeFileMarker);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    IOManager::log(LogLevel::Error, std::format("Error hashing file {}: cannot open",
                                                safe_path_to_string(path)));
    return std::nullopt;
  }

  EvpContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    IOManager::log(LogLevel::Error, "Error hashing file: MD5 unavailable");
    return std::nullopt;
  }

  std::array<char, kChunkSize> buffer{};
  while (in) {
    in.read(buffer.data(), buffer.size());
    const auto got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<std::size_t>(got)) != 1) {
      IOManager::log(LogLevel::Error,
                     std::format("Error hashing file {}: digest update failed",
                                 safe_path_to_string(path)));
      return std::nullopt;
    }
  }
  if (in.bad()) {
    IOManager::log(LogLevel::Error, std::format("Error hashing file {}: read failed",
                                                safe_path_to_string(path)));
    return std::nullopt;
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1) {
    IOManager::log(LogLevel::Error,
                   std::format("Error hashing file {}: digest finalization failed",
                               safe_path_to_string(path)));
    return std::nullopt;
  }
  return hex_from_bytes(digest.data(), digest_length);
}
