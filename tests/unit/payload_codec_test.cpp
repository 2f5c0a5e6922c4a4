#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/store/qdrant/filter_builder.hpp"
#include "internal/store/qdrant/payload_codec.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace qd   = engram::store::qdrant;
namespace util = engram::util;
namespace field = engram::store::qdrant::field;

engram::model::Note SampleNote() {
  engram::model::Note note;
  note.id         = "n1";
  note.project_id = "/work/alpha";
  note.group_id   = "backend";
  note.title      = "Pooling";
  note.text       = "use a pool";
  note.tags       = {"go", "db"};
  note.created_at = "2024-01-15T10:30:00.500Z";
  note.metadata.emplace();
  (*note.metadata->mutable_fields())["stars"].set_number_value(3);
  (*note.metadata->mutable_fields())["ratio"].set_number_value(0.5);
  return note;
}

void TestValueConversion() {
  google::protobuf::Value integral;
  integral.set_number_value(42);
  assert(qd::ToQdrantValue(integral).kind_case() == ::qdrant::Value::kIntegerValue);
  assert(qd::ToQdrantValue(integral).integer_value() == 42);

  google::protobuf::Value fractional;
  fractional.set_number_value(1.25);
  assert(qd::ToQdrantValue(fractional).kind_case() == ::qdrant::Value::kDoubleValue);

  google::protobuf::Value huge;
  huge.set_number_value(1e300);
  assert(qd::ToQdrantValue(huge).kind_case() == ::qdrant::Value::kDoubleValue);

  google::protobuf::Value nested;
  auto* list = nested.mutable_struct_value()->mutable_fields()->operator[]("items").mutable_list_value();
  list->add_values()->set_bool_value(true);
  list->add_values()->set_null_value(google::protobuf::NULL_VALUE);
  list->add_values()->set_string_value("x");
  assert(util::JsonEquals(qd::FromQdrantValue(qd::ToQdrantValue(nested)), nested));
}

void TestNotePayload() {
  const auto note    = SampleNote();
  const auto payload = qd::NotePayload(note);

  assert(payload.at(std::string(field::kId)).string_value() == "n1");
  assert(payload.at(std::string(field::kTags)).list_value().values_size() == 2);
  assert(payload.count(std::string(field::kSource)) == 0);

  const auto ts = payload.at(std::string(field::kCreatedAtTimestamp)).double_value();
  assert(std::abs(ts - util::ToUnixSeconds(*util::ParseRfc3339("2024-01-15T10:30:00.500Z"))) < 1e-6);

  auto decoded = qd::NoteFromPayload(payload);
  assert(decoded.has_value());
  assert(decoded->title == note.title);
  assert(!decoded->source.has_value());
  assert(decoded->tags == note.tags);
  assert(decoded->created_at == note.created_at);
  assert(util::JsonEquals(*decoded->metadata, *note.metadata));
}

void TestUnparsableCreatedAtHasNoTimestamp() {
  auto note       = SampleNote();
  note.created_at = "someday";
  const auto payload = qd::NotePayload(note);
  assert(payload.at(std::string(field::kCreatedAt)).string_value() == "someday");
  assert(payload.count(std::string(field::kCreatedAtTimestamp)) == 0);
}

void TestIdVerification() {
  const auto  payload  = qd::NotePayload(SampleNote());
  std::string expected = "n1";
  std::string other    = "n2";
  assert(qd::NoteFromPayload(payload, &expected).has_value());
  assert(!qd::NoteFromPayload(payload, &other).has_value());

  qd::Payload foreign;
  foreign["projectId"].set_string_value("/work/alpha");
  assert(!qd::NoteFromPayload(foreign).has_value());
  assert(!qd::GroupFromPayload(foreign).has_value());
  assert(!qd::GlobalConfigFromPayload(foreign).has_value());
}

void TestGlobalAndGroupPayloads() {
  engram::model::GlobalConfig config;
  config.id         = "global:/p:global.x";
  config.project_id = "/p";
  config.key        = "global.x";
  config.value.set_bool_value(true);
  config.updated_at = "2024-01-01T00:00:00Z";

  const auto payload = qd::GlobalConfigPayload(config);
  assert(payload.at(std::string(field::kType)).string_value() == qd::kTypeGlobalConfig);
  auto decoded = qd::GlobalConfigFromPayload(payload, &config.id);
  assert(decoded.has_value());
  assert(decoded->value.bool_value());
  assert(decoded->updated_at == config.updated_at);

  engram::model::Group group;
  group.id         = "grp-1";
  group.project_id = "/p";
  group.group_key  = "backend";
  group.title      = "Backend";
  group.created_at = *util::ParseRfc3339("2024-01-15T10:00:00Z");
  group.updated_at = *util::ParseRfc3339("2024-01-16T10:00:00Z");

  auto group_decoded = qd::GroupFromPayload(qd::GroupPayload(group));
  assert(group_decoded.has_value());
  assert(group_decoded->group_key == "backend");
  assert(group_decoded->created_at == group.created_at);
  assert(group_decoded->updated_at == group.updated_at);
}

void TestNoteFilter() {
  const auto since = *util::ParseRfc3339("2024-01-15T10:00:00Z");
  const auto until = *util::ParseRfc3339("2024-01-15T11:00:00Z");

  auto filter = qd::NoteFilter("/p", std::string("backend"), {"go", "db"}, since, until);
  assert(filter.must_size() == 5);
  assert(filter.must(0).field().key() == field::kProjectId);
  assert(filter.must(0).field().match().keyword() == "/p");
  assert(filter.must(1).field().key() == field::kGroupId);
  assert(filter.must(2).field().key() == field::kTags);
  assert(filter.must(3).field().match().keyword() == "db");

  const auto& range = filter.must(4).field().range();
  assert(range.has_gte() && range.gte() == util::ToUnixSeconds(since));
  assert(range.has_lt() && range.lt() == util::ToUnixSeconds(until));
  assert(!range.has_gt() && !range.has_lte());

  auto open = qd::NoteFilter("/p", std::nullopt, {}, std::nullopt, std::nullopt);
  assert(open.must_size() == 1);
  assert(open.should_size() == 0);
}

void TestKeywordFilter() {
  auto filter = qd::KeywordFilter({{field::kProjectId, "/p"}, {field::kType, std::string(qd::kTypeGroup)}});
  assert(filter.must_size() == 2);
  assert(filter.must(1).field().key() == "type");
  assert(filter.must(1).field().match().keyword() == "group");
}

} // namespace

int main() {
  TestValueConversion();
  TestNotePayload();
  TestUnparsableCreatedAtHasNoTimestamp();
  TestIdVerification();
  TestGlobalAndGroupPayloads();
  TestNoteFilter();
  TestKeywordFilter();

  std::cout << "engram_unit_payload_codec: pass\n";
  return 0;
}
