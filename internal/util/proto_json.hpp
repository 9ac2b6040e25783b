#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace cashgraph::util {

/*
  protobuf-JSON codec for the opaque payload columns (raw payload,
  provenance, exception context).

  Reads ignore unknown fields so that rows written by newer schema versions
  stay readable.
*/

std::string ToJson(const google::protobuf::Message& message);

// Empty input leaves `out` cleared. Throws util::InvalidState on malformed JSON.
void FromJson(const std::string& json, google::protobuf::Message* out);

} // namespace cashgraph::util
