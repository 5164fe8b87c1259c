#include "arrow_utils.hpp"

#include <arrow/buffer.h>
#include <arrow/io/file.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace codereview::storage::common {

void Unwrap(const arrow::Status& status, const std::string& what) {
  if (!status.ok()) {
    throw std::runtime_error(what + ": " + status.ToString());
  }
}

std::string ReadFile(const std::string& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path), "open " + path);
  auto size   = Unwrap(file->GetSize(), "stat " + path);
  auto buffer = Unwrap(file->Read(size), "read " + path);
  Unwrap(file->Close(), "close " + path);
  return buffer->ToString();
}

void AtomicWrite(const std::string& path, const std::string& content, bool fsync) {
  const auto tmp_path = path + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), "create " + tmp_path);
    Unwrap(out->Write(content.data(), static_cast<int64_t>(content.size())), "write " + tmp_path);
    if (fsync) {
      Unwrap(out->Flush(), "flush " + tmp_path);
    }
    Unwrap(out->Close(), "close " + tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw std::runtime_error("rename " + tmp_path + ": " + ec.message());
  }
}

} // namespace codereview::storage::common
