#include "json.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace engram::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw StoreError("json encode failed: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw StoreError("json decode failed: " + std::string(status.message()));
  }
}

std::string TagsToJson(const std::vector<std::string>& tags) {
  google::protobuf::ListValue list;
  for (const auto& tag : tags) {
    list.add_values()->set_string_value(tag);
  }
  return ToJson(list);
}

std::vector<std::string> TagsFromJson(const std::string& json) {
  std::vector<std::string> tags;
  if (json.empty()) {
    return tags;
  }

  google::protobuf::ListValue list;
  google::protobuf::util::JsonParseOptions options;
  if (!google::protobuf::util::JsonStringToMessage(json, &list, options).ok()) {
    return tags;
  }

  tags.reserve(list.values_size());
  for (const auto& v : list.values()) {
    if (v.kind_case() == google::protobuf::Value::kStringValue) {
      tags.push_back(v.string_value());
    }
  }
  return tags;
}

bool JsonEquals(const google::protobuf::Message& a, const google::protobuf::Message& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace engram::util
