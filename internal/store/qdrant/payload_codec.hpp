#pragma once

#include <google/protobuf/map.h>
#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/global_config.hpp"
#include "internal/model/group.hpp"
#include "internal/model/note.hpp"
#include "qdrant/json_with_int.pb.h"

namespace engram::store::qdrant {

using Payload = google::protobuf::Map<std::string, ::qdrant::Value>;

namespace field {
inline constexpr std::string_view kId                 = "id";
inline constexpr std::string_view kProjectId          = "projectId";
inline constexpr std::string_view kGroupId            = "groupId";
inline constexpr std::string_view kTitle              = "title";
inline constexpr std::string_view kText               = "text";
inline constexpr std::string_view kTags               = "tags";
inline constexpr std::string_view kSource             = "source";
inline constexpr std::string_view kCreatedAt          = "createdAt";
inline constexpr std::string_view kCreatedAtTimestamp = "createdAtTimestamp";
inline constexpr std::string_view kMetadata           = "metadata";
inline constexpr std::string_view kKey                = "key";
inline constexpr std::string_view kValue              = "value";
inline constexpr std::string_view kUpdatedAt          = "updatedAt";
inline constexpr std::string_view kGroupKey           = "groupKey";
inline constexpr std::string_view kDescription        = "description";
inline constexpr std::string_view kType               = "type";
} // namespace field

inline constexpr std::string_view kTypeGlobalConfig = "global_config";
inline constexpr std::string_view kTypeGroup        = "group";

// JSON numbers that are integral and fit int64 become integer values.
::qdrant::Value         ToQdrantValue(const google::protobuf::Value& value);
google::protobuf::Value FromQdrantValue(const ::qdrant::Value& value);

Payload NotePayload(const model::Note& note);
Payload GlobalConfigPayload(const model::GlobalConfig& config);
Payload GroupPayload(const model::Group& group);

// nullopt when the payload lacks a string id (not written by this
// backend) or its id differs from expected_id.
std::optional<model::Note>         NoteFromPayload(const Payload& payload, const std::string* expected_id = nullptr);
std::optional<model::GlobalConfig> GlobalConfigFromPayload(const Payload& payload,
                                                           const std::string* expected_id = nullptr);
std::optional<model::Group>        GroupFromPayload(const Payload& payload, const std::string* expected_id = nullptr);

} // namespace engram::store::qdrant
