#pragma once

#include "codereview/v1/progress.pb.h"
#include "internal/broker/progress_event.hpp"

namespace codereview::grpc {

codereview::v1::ProgressEvent ToProto(const broker::ProgressEvent& event);

// Wire-only events produced by the Subscribe stream itself.
codereview::v1::ProgressEvent SnapshotEvent(const model::Task& task);
codereview::v1::ProgressEvent HeartbeatEvent(const std::string& task_id);

bool IsTerminal(const broker::ProgressEvent& event);

} // namespace codereview::grpc
