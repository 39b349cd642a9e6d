#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string trim_ascii(std::string_view sv) {
  const auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
  };
  while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
  return std::string(sv);
}

// Turns "JPG", " .jpg " and ".Jpg" into ".jpg". Returns an empty string for
// blank input.
inline std::string normalize_extension(std::string_view extension) {
  std::string result = string_to_lower_ascii(trim_ascii(extension));
  if (result.empty()) {
    return result;
  }
  if (result.front() != '.') {
    result.insert(result.begin(), '.');
  }
  return result;
}

inline bool ends_with_ascii_ci(std::string_view text, std::string_view suffix) {
  if (suffix.size() > text.size()) {
    return false;
  }
  return string_to_lower_ascii(text.substr(text.size() - suffix.size())) ==
         string_to_lower_ascii(suffix);
}

// Translates a shell glob (*, ?, [...]) into an ECMAScript regex anchored at
// both ends. Unterminated brackets are taken literally.
inline std::string glob_to_regex(std::string_view glob) {
  std::string out = "^";
  for (std::size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    switch (c) {
      case '*':
        out += ".*";
        break;
      case '?':
        out += '.';
        break;
      case '[': {
        // As in fnmatch, a ']' right after '[' or '[!' is a member.
        std::size_t first = i + 1;
        const bool negated = first < glob.size() && glob[first] == '!';
        if (negated) ++first;
        const auto close = glob.find(']', first + 1);
        if (first >= glob.size() || close == std::string_view::npos) {
          out += "\\[";
          break;
        }
        const std::string_view body = glob.substr(first, close - first);
        out += negated ? "[^" : "[";
        for (char b : body) {
          if (b == '\\' || b == '^' || b == '[' || b == ']') out += '\\';
          out += b;
        }
        out += ']';
        i = close;
        break;
      }
      default:
        if (std::string_view("\\.^$|()+{}]").find(c) !=
            std::string_view::npos) {
          out += '\\';
        }
        out += c;
        break;
    }
  }
  out += '$';
  return out;
}
