#pragma once

#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace engram::model {

inline constexpr std::string_view kReservedGroupKey = "global";

struct Group {
  std::string id;
  std::string project_id;
  std::string group_key;  // unique within a project
  std::string title;
  std::string description;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  void Validate() const;
};

// "global" is reserved and cannot be created as a user group.
void ValidateGroupKeyForCreate(const std::string& group_key);

} // namespace engram::model
