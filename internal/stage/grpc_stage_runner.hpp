#pragma once

#include <chrono>
#include <memory>

#include "codereview/v1/stage_generator.grpc.pb.h"
#include "internal/stage/stage_runner.hpp"

namespace codereview::stage {

/*
  Delegates a stage to the external StageGenerator service.

  One unary call per stage with a per-call deadline. Any non-OK status is
  reported as a StageError for the stage being run.
*/
class GrpcStageRunner final : public StageRunner {
 public:
  GrpcStageRunner(std::shared_ptr<codereview::v1::StageGenerator::StubInterface> stub, std::chrono::milliseconds deadline);

  StageResult Run(const StageContext& context) override;

 private:
  std::shared_ptr<codereview::v1::StageGenerator::StubInterface> stub_;
  std::chrono::milliseconds                                      deadline_;
};

} // namespace codereview::stage
