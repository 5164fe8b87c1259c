#include "grpc_stage_runner.hpp"

#include <grpcpp/client_context.h>

#include "internal/model/task_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace codereview::stage {

using codereview::observability::StringField;

GrpcStageRunner::GrpcStageRunner(std::shared_ptr<codereview::v1::StageGenerator::StubInterface> stub, std::chrono::milliseconds deadline)
    : stub_(std::move(stub)), deadline_(deadline) {
}

StageResult GrpcStageRunner::Run(const StageContext& context) {
  codereview::v1::GenerateRequest request;
  request.set_task_id(context.task_id);
  request.set_stage(model::ToProto(context.stage));
  request.set_file_name(context.file_name);
  request.set_source(context.current_content);
  for (const auto& report : context.prior_reports) {
    model::ToProto(report, request.add_prior_reports());
  }
  for (const auto& [key, value] : context.options) {
    (*request.mutable_options())[key] = value;
  }

  ::grpc::ClientContext client_context;
  client_context.set_deadline(std::chrono::system_clock::now() + deadline_);

  codereview::v1::GenerateResponse response;
  const auto                       status = stub_->Generate(&client_context, request, &response);
  if (!status.ok()) {
    CODEREVIEW_LOG_WARN("stage generator call failed", {StringField("task_id", context.task_id), StringField("stage", model::StageName(context.stage)),
                                                        observability::IntField("code", status.error_code()),
                                                        StringField("error", status.error_message())});
    throw util::StageError(context.stage, "generator returned " + std::to_string(status.error_code()) + ": " + status.error_message());
  }

  StageResult result;
  result.report        = response.report();
  result.fixed_content = response.fixed_content();
  for (const auto& [key, value] : response.metrics()) {
    result.metrics.emplace(key, value);
  }
  return result;
}

} // namespace codereview::stage
