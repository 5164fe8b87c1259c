#pragma once

#include <memory>
#include <string>

namespace codereview::storage {

/*
  Where submitted sources are read from and fixed sources are written to.

  Implementations:
    DISK → Arrow file IO under a root directory
*/
class SourceStore {
 public:
  virtual ~SourceStore() = default;

  // Full content of a submitted source. Throws when it cannot be read.
  virtual std::string Load(const std::string& file_path) = 0;

  // Persists the fixed source for a task and returns where it landed.
  virtual std::string SaveFixed(const std::string& task_id, const std::string& file_name, const std::string& content) = 0;
};

using SourceStorePtr = std::shared_ptr<SourceStore>;

} // namespace codereview::storage
