#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace engram::model {

/*
  A memory note.

  id is caller-assigned and unique within a namespace. created_at is an
  RFC3339 UTC string; the store fills it with "now" when absent at write
  time. tags is never null in stored form.
*/
struct Note {
  std::string id;
  std::string project_id;  // canonicalized project path
  std::string group_id;    // [a-zA-Z0-9_-]+, "global" is the sentinel group

  std::optional<std::string> title;
  std::string                text;

  std::vector<std::string> tags;  // case-sensitive, duplicates permitted

  std::optional<std::string> source;
  std::optional<std::string> created_at;

  std::optional<google::protobuf::Struct> metadata;

  // Throws util::InvalidArgument.
  void Validate() const;
};

void ValidateGroupId(const std::string& group_id);

bool IsIdentifierChars(const std::string& value);

} // namespace engram::model
