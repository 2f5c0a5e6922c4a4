#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"
#include "qdrant/points.pb.h"

namespace engram::store::qdrant {

/*
  Server-side filters equivalent to the local scope and time predicates.

  Every condition lands in `must`: project equality, optional group
  equality, one keyword match per required tag (AND), and a
  createdAtTimestamp range (gte since, lt until) when a bound is set.
*/
::qdrant::Filter NoteFilter(const std::string& project_id, const std::optional<std::string>& group_id,
                            const std::vector<std::string>& tags,
                            const std::optional<util::TimePoint>& since = std::nullopt,
                            const std::optional<util::TimePoint>& until = std::nullopt);

// All (field, keyword) pairs must match.
::qdrant::Filter KeywordFilter(const std::vector<std::pair<std::string_view, std::string>>& matches);

} // namespace engram::store::qdrant
