#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace codereview::storage::common {

// Arrow reports IO failures as Status; the source store surfaces them as
// exceptions carrying the Arrow message.
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& what) {
  if (!result.ok()) {
    throw std::runtime_error(what + ": " + result.status().ToString());
  }
  return std::move(result).ValueUnsafe();
}

void Unwrap(const arrow::Status& status, const std::string& what);

// Whole file as text.
std::string ReadFile(const std::string& path);

// Writes <path>.tmp and renames it over path, so a reader sees either the
// previous file or the complete new one.
void AtomicWrite(const std::string& path, const std::string& content, bool fsync);

} // namespace codereview::storage::common
