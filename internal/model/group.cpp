#include "group.hpp"

#include "internal/model/note.hpp"
#include "internal/util/errors.hpp"

namespace engram::model {

void ValidateGroupKeyForCreate(const std::string& group_key) {
  if (group_key.empty()) {
    throw util::InvalidArgument("groupKey must not be empty");
  }
  if (group_key == kReservedGroupKey) {
    throw util::InvalidArgument("groupKey 'global' is reserved and cannot be used");
  }
  if (!IsIdentifierChars(group_key)) {
    throw util::InvalidArgument("groupKey must match ^[a-zA-Z0-9_-]+$, got \"" + group_key + "\"");
  }
}

void Group::Validate() const {
  if (id.empty()) {
    throw util::InvalidArgument("id must not be empty");
  }
  if (project_id.empty()) {
    throw util::InvalidArgument("projectId must not be empty");
  }
  ValidateGroupKeyForCreate(group_key);
  if (title.empty()) {
    throw util::InvalidArgument("title must not be empty");
  }
}

} // namespace engram::model
