#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging, display and persistence.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Inverse of safe_path_to_string: builds a path from UTF-8 text.
inline fs::path path_from_utf8(std::string_view utf8) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(utf8.data()),
                                utf8.size()));
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

// Case-insensitive (ASCII) substring test.
inline bool contains_ignore_case(std::string_view haystack,
                                 std::string_view needle) {
  if (needle.empty()) return false;
  return string_to_lower_ascii(haystack).find(string_to_lower_ascii(needle)) !=
         std::string::npos;
}

inline std::string join_strings(const std::vector<std::string>& parts,
                                std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) result += separator;
    result += parts[i];
  }
  return result;
}

inline void ensure_directory(const fs::path& dir) {
  if (!dir.empty()) {
    fs::create_directories(dir);
  }
}
