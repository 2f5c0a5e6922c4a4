#include "scoring.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::store {

double CosineDistance(const Embedding& a, const Embedding& b) {
  if (a.size() != b.size() || a.empty()) {
    return 2.0;
  }

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 2.0;
  }

  const double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
  return std::clamp(1.0 - similarity, 0.0, 2.0);
}

double ScoreFromDistance(double distance) {
  return std::clamp(1.0 - distance / 2.0, 0.0, 1.0);
}

bool IsComparableQuery(const Embedding& query, std::size_t stored_dim) {
  if (query.empty() || query.size() != stored_dim) {
    return false;
  }
  return std::any_of(query.begin(), query.end(), [](float v) { return v != 0.0f; });
}

bool ContainsAllTags(const std::vector<std::string>& tags, const std::vector<std::string>& required) {
  for (const auto& want : required) {
    if (std::find(tags.begin(), tags.end(), want) == tags.end()) {
      return false;
    }
  }
  return true;
}

bool MatchesScope(const model::Note& note, const std::string& project_id, const std::optional<std::string>& group_id,
                  const std::vector<std::string>& required_tags) {
  if (note.project_id != project_id) {
    return false;
  }
  if (group_id && note.group_id != *group_id) {
    return false;
  }
  return ContainsAllTags(note.tags, required_tags);
}

bool InTimeRange(const model::Note& note, const std::optional<util::TimePoint>& since,
                 const std::optional<util::TimePoint>& until) {
  if (!since && !until) {
    return true;
  }
  if (!note.created_at) {
    return false;
  }

  auto created = util::ParseRfc3339(*note.created_at);
  if (!created) {
    return false;
  }
  // Same key the remote backend stores as createdAtTimestamp.
  const double created_key = util::ToUnixSeconds(*created);
  if (since && created_key < util::ToUnixSeconds(*since)) {
    return false;
  }
  if (until && created_key >= util::ToUnixSeconds(*until)) {
    return false;
  }
  return true;
}

void RankAndTruncate(std::vector<SearchResult>& results, int top_k) {
  std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.note.id < b.note.id;
  });
  if (top_k >= 0 && results.size() > static_cast<std::size_t>(top_k)) {
    results.resize(static_cast<std::size_t>(top_k));
  }
}

void SortByRecency(std::vector<model::Note>& notes, int limit) {
  std::vector<std::pair<std::optional<util::TimePoint>, model::Note>> keyed;
  keyed.reserve(notes.size());

  for (auto& note : notes) {
    std::optional<util::TimePoint> created;
    if (note.created_at) {
      created = util::ParseRfc3339(*note.created_at);
      if (!created) {
        ENGRAM_LOG_WARN("unparsable createdAt, sorting last",
                        {observability::StringField("id", note.id),
                         observability::StringField("created_at", *note.created_at)});
      }
    }
    keyed.emplace_back(created, std::move(note));
  }

  std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
    if (a.first.has_value() != b.first.has_value()) {
      return a.first.has_value();
    }
    if (a.first && *a.first != *b.first) {
      return *a.first > *b.first;
    }
    return a.second.id < b.second.id;
  });

  notes.clear();
  for (auto& [created, note] : keyed) {
    if (limit >= 0 && notes.size() >= static_cast<std::size_t>(limit)) {
      break;
    }
    notes.push_back(std::move(note));
  }
}

void ValidateSearchOptions(const SearchOptions& opts) {
  if (opts.project_id.empty()) {
    throw util::InvalidArgument("search: projectId must not be empty");
  }
  if (opts.top_k <= 0) {
    throw util::InvalidArgument("search: topK must be positive, got " + std::to_string(opts.top_k));
  }
}

void ValidateListOptions(const ListOptions& opts) {
  if (opts.project_id.empty()) {
    throw util::InvalidArgument("list recent: projectId must not be empty");
  }
  if (opts.limit <= 0) {
    throw util::InvalidArgument("list recent: limit must be positive, got " + std::to_string(opts.limit));
  }
}

model::Note WithCreatedAt(const model::Note& note) {
  model::Note stored = note;
  if (!stored.created_at || stored.created_at->empty()) {
    stored.created_at = util::NowRfc3339();
  }
  return stored;
}

model::Group WithGroupTimestamps(const model::Group& group) {
  model::Group stored = group;
  if (stored.created_at == util::TimePoint{}) {
    stored.created_at = util::Now();
  }
  if (stored.updated_at == util::TimePoint{}) {
    stored.updated_at = stored.created_at;
  }
  stored.created_at = std::chrono::floor<std::chrono::seconds>(stored.created_at);
  stored.updated_at = std::chrono::floor<std::chrono::seconds>(stored.updated_at);
  return stored;
}

void SortGroups(std::vector<model::Group>& groups) {
  std::sort(groups.begin(), groups.end(), [](const model::Group& a, const model::Group& b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.group_key < b.group_key;
  });
}

} // namespace engram::store
