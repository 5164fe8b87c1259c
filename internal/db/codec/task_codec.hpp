#pragma once

#include "internal/db/model/task_record.hpp"
#include "internal/model/task.hpp"

namespace codereview::db::codec {

/*
  Task <-> TaskRecord.

  The row body is the codereview.v1.Task JSON mapping so both backends
  store the same document. Decode throws util::InvalidArgument on a
  malformed document.
*/
model::TaskRecord EncodeTask(const codereview::model::Task& task);

codereview::model::Task DecodeTask(const model::TaskRecord& record);

} // namespace codereview::db::codec
