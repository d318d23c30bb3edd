#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace jobflow::storage::common {

inline void ValidateContentKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("content key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("content key contains invalid character");
    }
  }
  if (key == "." || key == "..") {
    throw std::invalid_argument("content key must not be a relative path component");
  }
}

inline std::filesystem::path ContentPath(const std::filesystem::path& root, const std::string& key) {
  ValidateContentKey(key);
  return root / key;
}

// "<parameter id>_<file name>", unique because parameter IDs are.
inline std::string ContentKeyFor(uint64_t parameter_id, const std::string& path) {
  auto name = std::filesystem::path(path).filename().string();
  if (name.empty() || name == "." || name == "..") {
    name = "contents";
  }
  return std::to_string(parameter_id) + "_" + name;
}

// "array_<parameter id>"; file keys start with a digit, so the two never meet.
inline std::string ArrayContentKeyFor(uint64_t parameter_id) {
  return "array_" + std::to_string(parameter_id);
}

} // namespace jobflow::storage::common
