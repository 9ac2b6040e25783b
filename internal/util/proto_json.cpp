#include "proto_json.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace cashgraph::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw InvalidState("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* out) {
  out->Clear();
  if (json.empty()) return;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, out, options);
  if (!status.ok()) {
    throw InvalidState("failed to decode " + out->GetTypeName() + ": " + std::string(status.message()));
  }
}

} // namespace cashgraph::util
