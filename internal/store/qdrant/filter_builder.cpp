#include "filter_builder.hpp"

#include "internal/store/qdrant/payload_codec.hpp"

namespace engram::store::qdrant {

namespace {

void AddKeyword(::qdrant::Filter& filter, std::string_view key, const std::string& keyword) {
  auto* condition = filter.add_must()->mutable_field();
  condition->set_key(std::string(key));
  condition->mutable_match()->set_keyword(keyword);
}

} // namespace

::qdrant::Filter NoteFilter(const std::string& project_id, const std::optional<std::string>& group_id,
                            const std::vector<std::string>& tags, const std::optional<util::TimePoint>& since,
                            const std::optional<util::TimePoint>& until) {
  ::qdrant::Filter filter;
  AddKeyword(filter, field::kProjectId, project_id);
  if (group_id) {
    AddKeyword(filter, field::kGroupId, *group_id);
  }
  for (const auto& tag : tags) {
    AddKeyword(filter, field::kTags, tag);
  }

  if (since || until) {
    auto* condition = filter.add_must()->mutable_field();
    condition->set_key(std::string(field::kCreatedAtTimestamp));
    auto* range = condition->mutable_range();
    if (since) {
      range->set_gte(util::ToUnixSeconds(*since));
    }
    if (until) {
      range->set_lt(util::ToUnixSeconds(*until));
    }
  }
  return filter;
}

::qdrant::Filter KeywordFilter(const std::vector<std::pair<std::string_view, std::string>>& matches) {
  ::qdrant::Filter filter;
  for (const auto& [key, keyword] : matches) {
    AddKeyword(filter, key, keyword);
  }
  return filter;
}

} // namespace engram::store::qdrant
