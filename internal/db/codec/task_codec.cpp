#include "task_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/model/task_proto.hpp"
#include "internal/util/errors.hpp"

namespace codereview::db::codec {

model::TaskRecord EncodeTask(const codereview::model::Task& task) {
  const auto proto = codereview::model::ToProto(task);

  model::TaskRecord record;
  record.id            = task.id;
  record.status        = static_cast<int>(proto.status());
  record.created_at_ms = util::ToUnixMillis(task.created_at);
  record.updated_at_ms = util::ToUnixMillis(task.updated_at);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status                  = google::protobuf::util::MessageToJsonString(proto, &record.json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to encode task " + task.id + ": " + std::string(status.message()));
  }
  return record;
}

codereview::model::Task DecodeTask(const model::TaskRecord& record) {
  codereview::v1::Task proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status             = google::protobuf::util::JsonStringToMessage(record.json, &proto, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to decode task " + record.id + ": " + std::string(status.message()));
  }
  if (proto.id() != record.id) {
    throw util::InvalidArgument("task record " + record.id + " holds document for " + proto.id());
  }
  return codereview::model::FromProto(proto);
}

} // namespace codereview::db::codec
