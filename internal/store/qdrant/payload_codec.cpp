#include "payload_codec.hpp"

#include <cmath>

#include "internal/util/time.hpp"

namespace engram::store::qdrant {

namespace {

// 2^63; doubles at or beyond it do not fit int64.
constexpr double kInt64Bound = 9223372036854775808.0;

::qdrant::Value StringValue(const std::string& s) {
  ::qdrant::Value v;
  v.set_string_value(s);
  return v;
}

::qdrant::Value DoubleValue(double d) {
  ::qdrant::Value v;
  v.set_double_value(d);
  return v;
}

void Put(Payload& payload, std::string_view key, ::qdrant::Value value) {
  payload[std::string(key)] = std::move(value);
}

const ::qdrant::Value* Find(const Payload& payload, std::string_view key) {
  auto it = payload.find(std::string(key));
  return it == payload.end() ? nullptr : &it->second;
}

std::optional<std::string> GetString(const Payload& payload, std::string_view key) {
  const auto* v = Find(payload, key);
  if (!v || v->kind_case() != ::qdrant::Value::kStringValue) {
    return std::nullopt;
  }
  return v->string_value();
}

std::string GetStringOr(const Payload& payload, std::string_view key) {
  auto v = GetString(payload, key);
  return v ? *v : std::string();
}

bool IdMatches(const std::optional<std::string>& id, const std::string* expected_id) {
  if (!id) {
    return false;
  }
  return expected_id == nullptr || *id == *expected_id;
}

util::TimePoint GetTime(const Payload& payload, std::string_view key) {
  auto text = GetString(payload, key);
  if (!text) {
    return {};
  }
  auto tp = util::ParseRfc3339(*text);
  return tp ? *tp : util::TimePoint{};
}

} // namespace

// ------------------------------------------------------------
// Values
// ------------------------------------------------------------

::qdrant::Value ToQdrantValue(const google::protobuf::Value& value) {
  ::qdrant::Value out;
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
      const double d = value.number_value();
      if (std::isfinite(d) && std::trunc(d) == d && d >= -kInt64Bound && d < kInt64Bound) {
        out.set_integer_value(static_cast<std::int64_t>(d));
      } else {
        out.set_double_value(d);
      }
      break;
    }
    case google::protobuf::Value::kStringValue:
      out.set_string_value(value.string_value());
      break;
    case google::protobuf::Value::kBoolValue:
      out.set_bool_value(value.bool_value());
      break;
    case google::protobuf::Value::kStructValue: {
      auto* fields = out.mutable_struct_value()->mutable_fields();
      for (const auto& [k, v] : value.struct_value().fields()) {
        (*fields)[k] = ToQdrantValue(v);
      }
      break;
    }
    case google::protobuf::Value::kListValue: {
      auto* list = out.mutable_list_value();
      for (const auto& v : value.list_value().values()) {
        *list->add_values() = ToQdrantValue(v);
      }
      break;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out.set_null_value(::qdrant::NULL_VALUE);
      break;
  }
  return out;
}

google::protobuf::Value FromQdrantValue(const ::qdrant::Value& value) {
  google::protobuf::Value out;
  switch (value.kind_case()) {
    case ::qdrant::Value::kDoubleValue:
      out.set_number_value(value.double_value());
      break;
    case ::qdrant::Value::kIntegerValue:
      out.set_number_value(static_cast<double>(value.integer_value()));
      break;
    case ::qdrant::Value::kStringValue:
      out.set_string_value(value.string_value());
      break;
    case ::qdrant::Value::kBoolValue:
      out.set_bool_value(value.bool_value());
      break;
    case ::qdrant::Value::kStructValue: {
      auto* fields = out.mutable_struct_value()->mutable_fields();
      for (const auto& [k, v] : value.struct_value().fields()) {
        (*fields)[k] = FromQdrantValue(v);
      }
      break;
    }
    case ::qdrant::Value::kListValue: {
      auto* list = out.mutable_list_value();
      for (const auto& v : value.list_value().values()) {
        *list->add_values() = FromQdrantValue(v);
      }
      break;
    }
    case ::qdrant::Value::kNullValue:
    case ::qdrant::Value::KIND_NOT_SET:
      out.set_null_value(google::protobuf::NULL_VALUE);
      break;
  }
  return out;
}

// ------------------------------------------------------------
// Notes
// ------------------------------------------------------------

Payload NotePayload(const model::Note& note) {
  Payload payload;
  Put(payload, field::kId, StringValue(note.id));
  Put(payload, field::kProjectId, StringValue(note.project_id));
  Put(payload, field::kGroupId, StringValue(note.group_id));
  Put(payload, field::kText, StringValue(note.text));

  if (note.title) {
    Put(payload, field::kTitle, StringValue(*note.title));
  }
  if (note.source) {
    Put(payload, field::kSource, StringValue(*note.source));
  }
  if (note.created_at) {
    Put(payload, field::kCreatedAt, StringValue(*note.created_at));
    if (auto created = util::ParseRfc3339(*note.created_at)) {
      Put(payload, field::kCreatedAtTimestamp, DoubleValue(util::ToUnixSeconds(*created)));
    }
  }

  ::qdrant::Value tags;
  auto*           list = tags.mutable_list_value();
  for (const auto& tag : note.tags) {
    list->add_values()->set_string_value(tag);
  }
  Put(payload, field::kTags, std::move(tags));

  if (note.metadata) {
    google::protobuf::Value metadata;
    *metadata.mutable_struct_value() = *note.metadata;
    Put(payload, field::kMetadata, ToQdrantValue(metadata));
  }
  return payload;
}

std::optional<model::Note> NoteFromPayload(const Payload& payload, const std::string* expected_id) {
  auto id = GetString(payload, field::kId);
  if (!IdMatches(id, expected_id)) {
    return std::nullopt;
  }

  model::Note note;
  note.id         = *id;
  note.project_id = GetStringOr(payload, field::kProjectId);
  note.group_id   = GetStringOr(payload, field::kGroupId);
  note.text       = GetStringOr(payload, field::kText);
  note.title      = GetString(payload, field::kTitle);
  note.source     = GetString(payload, field::kSource);
  note.created_at = GetString(payload, field::kCreatedAt);

  if (const auto* tags = Find(payload, field::kTags); tags && tags->has_list_value()) {
    for (const auto& v : tags->list_value().values()) {
      if (v.kind_case() == ::qdrant::Value::kStringValue) {
        note.tags.push_back(v.string_value());
      }
    }
  }

  if (const auto* metadata = Find(payload, field::kMetadata); metadata && metadata->has_struct_value()) {
    note.metadata = FromQdrantValue(*metadata).struct_value();
  }
  return note;
}

// ------------------------------------------------------------
// Global config
// ------------------------------------------------------------

Payload GlobalConfigPayload(const model::GlobalConfig& config) {
  Payload payload;
  Put(payload, field::kId, StringValue(config.id));
  Put(payload, field::kProjectId, StringValue(config.project_id));
  Put(payload, field::kKey, StringValue(config.key));
  Put(payload, field::kValue, ToQdrantValue(config.value));
  if (config.updated_at) {
    Put(payload, field::kUpdatedAt, StringValue(*config.updated_at));
  }
  Put(payload, field::kType, StringValue(std::string(kTypeGlobalConfig)));
  return payload;
}

std::optional<model::GlobalConfig> GlobalConfigFromPayload(const Payload& payload, const std::string* expected_id) {
  auto id = GetString(payload, field::kId);
  if (!IdMatches(id, expected_id)) {
    return std::nullopt;
  }

  model::GlobalConfig config;
  config.id         = *id;
  config.project_id = GetStringOr(payload, field::kProjectId);
  config.key        = GetStringOr(payload, field::kKey);
  config.updated_at = GetString(payload, field::kUpdatedAt);

  if (const auto* value = Find(payload, field::kValue)) {
    config.value = FromQdrantValue(*value);
  } else {
    config.value.set_null_value(google::protobuf::NULL_VALUE);
  }
  return config;
}

// ------------------------------------------------------------
// Groups
// ------------------------------------------------------------

Payload GroupPayload(const model::Group& group) {
  Payload payload;
  Put(payload, field::kId, StringValue(group.id));
  Put(payload, field::kProjectId, StringValue(group.project_id));
  Put(payload, field::kGroupKey, StringValue(group.group_key));
  Put(payload, field::kTitle, StringValue(group.title));
  Put(payload, field::kDescription, StringValue(group.description));
  Put(payload, field::kCreatedAt, StringValue(util::FormatRfc3339(group.created_at)));
  Put(payload, field::kUpdatedAt, StringValue(util::FormatRfc3339(group.updated_at)));
  Put(payload, field::kType, StringValue(std::string(kTypeGroup)));
  return payload;
}

std::optional<model::Group> GroupFromPayload(const Payload& payload, const std::string* expected_id) {
  auto id = GetString(payload, field::kId);
  if (!IdMatches(id, expected_id)) {
    return std::nullopt;
  }

  model::Group group;
  group.id          = *id;
  group.project_id  = GetStringOr(payload, field::kProjectId);
  group.group_key   = GetStringOr(payload, field::kGroupKey);
  group.title       = GetStringOr(payload, field::kTitle);
  group.description = GetStringOr(payload, field::kDescription);
  group.created_at  = GetTime(payload, field::kCreatedAt);
  group.updated_at  = GetTime(payload, field::kUpdatedAt);
  return group;
}

} // namespace engram::store::qdrant
