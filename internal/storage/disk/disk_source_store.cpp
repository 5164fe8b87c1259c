#include "disk_source_store.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace codereview::storage {

using namespace codereview::storage::common;

DiskSourceStore::DiskSourceStore(std::filesystem::path fixed_root, bool fsync)
    : fixed_root_(std::move(fixed_root)), fsync_(fsync) {

  std::filesystem::create_directories(fixed_root_);
}

/*
  Read the whole submitted source.
*/
std::string DiskSourceStore::Load(const std::string& file_path) {
  if (file_path.empty()) {
    throw util::InvalidArgument("file path must not be empty");
  }

  return ReadFile(file_path);
}

/*
  Atomic write:
      mkdir task dir → write tmp → flush → rename
*/
std::string DiskSourceStore::SaveFixed(const std::string& task_id,
                                       const std::string& file_name,
                                       const std::string& content) {

  auto final_path = FixedPath(fixed_root_, task_id, file_name);
  std::filesystem::create_directories(final_path.parent_path());

  AtomicWrite(final_path.string(), content, fsync_);
  return final_path.string();
}

}
