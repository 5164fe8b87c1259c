#pragma once

#include <cstdint>
#include <string>

namespace codereview::db::model {

/*
  Persistent task row.

  status and the timestamps are duplicated out of the JSON document so
  backends can order and filter without decoding it.
*/
struct TaskRecord {
  std::string id;
  int         status        = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;

  // codereview.v1.Task encoded with the protobuf JSON mapping.
  std::string json;
};

} // namespace codereview::db::model
