#pragma once

#include <filesystem>

#include "internal/storage/source_store.hpp"

namespace codereview::storage {

/*
  Disk-backed sources using Arrow IO.

  Properties:
    - fixed sources land in <root>/<task_id>/<sanitized file name>
    - atomic replace writes
    - optional fsync
*/
class DiskSourceStore final : public SourceStore {
public:
  explicit DiskSourceStore(std::filesystem::path fixed_root, bool fsync = false);

  std::string Load(const std::string& file_path) override;

  std::string SaveFixed(const std::string& task_id,
                        const std::string& file_name,
                        const std::string& content) override;

  const std::filesystem::path& FixedRoot() const { return fixed_root_; }

private:
  std::filesystem::path fixed_root_;
  bool fsync_;
};

}
