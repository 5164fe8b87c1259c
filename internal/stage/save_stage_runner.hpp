#pragma once

#include "internal/stage/stage_runner.hpp"
#include "internal/storage/source_store.hpp"

namespace codereview::stage {

// Persists the newest source version through the SourceStore.
class SaveStageRunner final : public StageRunner {
 public:
  explicit SaveStageRunner(storage::SourceStorePtr store);

  StageResult Run(const StageContext& context) override;

 private:
  storage::SourceStorePtr store_;
};

} // namespace codereview::stage
