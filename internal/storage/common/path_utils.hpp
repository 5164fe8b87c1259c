#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace codereview::storage::common {

inline constexpr std::size_t kMaxFileNameLength = 255;

inline void ValidateTaskId(const std::string& task_id) {
  if (task_id.empty()) {
    throw util::InvalidArgument("task id must not be empty");
  }
  for (char c : task_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("task id contains invalid character");
    }
  }
  if (task_id == "." || task_id == "..") {
    throw util::InvalidArgument("task id must not be a relative path component");
  }
}

/*
  Replaces characters that are unsafe in a file name with '_' and caps the
  length at 255 bytes, keeping the extension.
*/
inline std::string SanitizeFileName(const std::string& file_name) {
  std::string out;
  out.reserve(file_name.size());
  for (char c : file_name) {
    switch (c) {
      case '<':
      case '>':
      case ':':
      case '"':
      case '/':
      case '\\':
      case '|':
      case '?':
      case '*':
      case '\0':
        out.push_back('_');
        break;
      default:
        out.push_back(c);
    }
  }

  if (out.empty() || out == "." || out == "..") {
    return "source.txt";
  }

  if (out.size() > kMaxFileNameLength) {
    const auto dot = out.rfind('.');
    const auto ext = dot == std::string::npos || out.size() - dot >= kMaxFileNameLength ? std::string() : out.substr(dot);
    out            = out.substr(0, kMaxFileNameLength - ext.size()) + ext;
  }
  return out;
}

inline std::filesystem::path FixedPath(const std::filesystem::path& root, const std::string& task_id, const std::string& file_name) {
  ValidateTaskId(task_id);
  return root / task_id / SanitizeFileName(file_name);
}

} // namespace codereview::storage::common
