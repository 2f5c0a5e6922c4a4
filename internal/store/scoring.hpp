#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/group.hpp"
#include "internal/model/note.hpp"
#include "internal/store/types.hpp"
#include "internal/util/time.hpp"

namespace engram::store {

/*
  Filter, score and ordering rules shared by every backend.

  The remote backend pushes the same predicates down as server-side
  filters; the local backends call these directly.
*/

// Cosine distance in [0, 2]. Mismatched lengths, empty vectors and
// zero-norm vectors all yield 2.0.
double CosineDistance(const Embedding& a, const Embedding& b);

// Maps a distance in [0, 2] to a score in [0, 1].
double ScoreFromDistance(double distance);

// True when the query can be compared against stored vectors of this
// length (same length, non-zero norm).
bool IsComparableQuery(const Embedding& query, std::size_t stored_dim);

// Every required tag is present (case-sensitive). Empty required matches all.
bool ContainsAllTags(const std::vector<std::string>& tags, const std::vector<std::string>& required);

// Project equality, optional group equality and tag AND.
bool MatchesScope(const model::Note& note, const std::string& project_id, const std::optional<std::string>& group_id,
                  const std::vector<std::string>& required_tags);

// since <= createdAt < until. With any bound set, notes whose createdAt is
// missing or unparsable are excluded.
bool InTimeRange(const model::Note& note, const std::optional<util::TimePoint>& since,
                 const std::optional<util::TimePoint>& until);

// Score descending, then note id ascending; keeps at most top_k.
void RankAndTruncate(std::vector<SearchResult>& results, int top_k);

// createdAt descending with missing/unparsable values last, then id
// ascending; keeps at most limit. Logs a warning per unparsable value.
void SortByRecency(std::vector<model::Note>& notes, int limit);

// Throw util::InvalidArgument on an empty project or non-positive bound.
void ValidateSearchOptions(const SearchOptions& opts);
void ValidateListOptions(const ListOptions& opts);

// Copy with created_at filled when absent.
model::Note WithCreatedAt(const model::Note& note);

// Copy with unset timestamps filled with now (updated_at falls back to
// created_at) and both floored to whole seconds, the precision every
// backend persists.
model::Group WithGroupTimestamps(const model::Group& group);

// createdAt ascending, then groupKey.
void SortGroups(std::vector<model::Group>& groups);

} // namespace engram::store
