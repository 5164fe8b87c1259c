#pragma once

#include "codereview/v1/task.pb.h"
#include "internal/model/task.hpp"

namespace codereview::model {

/*
  Conversions between the in-memory task model and the wire/persistence
  protobuf representation.

  FromProto throws util::InvalidArgument on unknown enum values or a
  stage_states list that does not cover every stage.
*/

codereview::v1::Stage       ToProto(Stage stage);
codereview::v1::StageStatus ToProto(StageStatus status);
codereview::v1::TaskStatus  ToProto(TaskStatus status);

Stage       FromProto(codereview::v1::Stage stage);
StageStatus FromProto(codereview::v1::StageStatus status);
TaskStatus  FromProto(codereview::v1::TaskStatus status);

void ToProto(const StageReport& report, codereview::v1::StageReport* out);
StageReport FromProto(const codereview::v1::StageReport& report);

codereview::v1::Task ToProto(const Task& task);
Task                 FromProto(const codereview::v1::Task& task);

} // namespace codereview::model
