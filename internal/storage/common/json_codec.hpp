#pragma once

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

namespace relay::storage::common {

/*
  Protobuf <-> JSON helpers for persisted values.

  Unknown fields are ignored on read so an older binary can still load
  a store written by a newer one within the same storage version.
*/
template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = false;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode JSON: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode JSON: " + std::string(status.message()));
  }
  return message;
}

} // namespace relay::storage::common
