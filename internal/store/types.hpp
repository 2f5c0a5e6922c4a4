#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/note.hpp"
#include "internal/util/time.hpp"

namespace engram::store {

using Embedding = std::vector<float>;

struct SearchOptions {
  std::string                project_id;  // required
  std::optional<std::string> group_id;    // unset = every group in the project
  std::vector<std::string>   tags;        // AND filter, case-sensitive

  // Half-open: since <= createdAt < until.
  std::optional<util::TimePoint> since;
  std::optional<util::TimePoint> until;

  int top_k = 5;
};

struct ListOptions {
  std::string                project_id;
  std::optional<std::string> group_id;
  std::vector<std::string>   tags;

  int limit = 10;
};

struct SearchResult {
  model::Note note;
  double      score = 0.0;  // [0, 1], 1.0 = identical direction
};

} // namespace engram::store
