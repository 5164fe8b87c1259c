#pragma once

#include "codereview/v1/task.pb.h"
#include "codereview/v1/progress.pb.h"

#include "codereview/v1/review_service.pb.h"
#include "codereview/v1/stage_generator.pb.h"

#include "codereview/v1/review_service.grpc.pb.h"
#include "codereview/v1/stage_generator.grpc.pb.h"
