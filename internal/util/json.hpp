#pragma once

#include <string>
#include <vector>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace engram::util {

/*
  JSON text <-> protobuf well-known types.

  Opaque JSON values (note metadata, global config values) are held as
  google.protobuf.Struct / Value and persisted as JSON text.
*/

std::string ToJson(const google::protobuf::Message& message);

void FromJson(const std::string& json, google::protobuf::Message* message);

std::string TagsToJson(const std::vector<std::string>& tags);

// Non-string entries are dropped; empty or malformed input yields no tags.
std::vector<std::string> TagsFromJson(const std::string& json);

bool JsonEquals(const google::protobuf::Message& a, const google::protobuf::Message& b);

} // namespace engram::util
