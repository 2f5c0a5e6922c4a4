#include "note.hpp"

#include "internal/util/errors.hpp"

namespace engram::model {

bool IsIdentifierChars(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (char c : value) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

void ValidateGroupId(const std::string& group_id) {
  if (group_id.empty()) {
    throw util::InvalidArgument("groupId must not be empty");
  }
  if (!IsIdentifierChars(group_id)) {
    throw util::InvalidArgument("groupId must match ^[a-zA-Z0-9_-]+$, got \"" + group_id + "\"");
  }
}

void Note::Validate() const {
  if (id.empty()) {
    throw util::InvalidArgument("id must not be empty");
  }
  if (project_id.empty()) {
    throw util::InvalidArgument("projectId must not be empty");
  }
  ValidateGroupId(group_id);
  if (text.empty()) {
    throw util::InvalidArgument("text must not be empty");
  }
}

} // namespace engram::model
